#include "sizeformatter.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace SizeFormatter {

QString formatFileSize(qint64 bytes)
{
    if (bytes == 0) {
        return "0 Bytes";
    }

    static const char* const units[] = { "Bytes", "KB", "MB", "GB" };
    const double absolute = std::fabs(static_cast<double>(bytes));
    int unit = static_cast<int>(std::floor(std::log(absolute) / std::log(1024.0)));
    unit = std::max(0, std::min(unit, 3));

    const double value = std::round(absolute / std::pow(1024.0, unit) * 100.0) / 100.0;
    const QString formatted = QString("%1 %2").arg(QString::number(value), units[unit]);
    return bytes < 0 ? "-" + formatted : formatted;
}

QString savings(qint64 originalSize, qint64 optimizedSize)
{
    return formatFileSize(originalSize - optimizedSize);
}

int compressionPercentage(qint64 originalSize, qint64 optimizedSize)
{
    if (originalSize == 0) {
        return 0;
    }
    const double ratio = static_cast<double>(optimizedSize) / static_cast<double>(originalSize);
    return static_cast<int>(std::round((1.0 - ratio) * 100.0));
}

QString compressionLabel(qint64 originalSize, qint64 optimizedSize)
{
    if (originalSize == 0) {
        return "0% change";
    }
    const int percentage = compressionPercentage(originalSize, optimizedSize);
    if (percentage >= 0) {
        return QString("%1% smaller").arg(percentage);
    }
    return QString("%1% larger").arg(std::abs(percentage));
}

QString optimizedFileName(const QString& originalName, ImageFormat format)
{
    const int dot = originalName.lastIndexOf('.');
    QString baseName;
    if (dot > 0) {
        baseName = originalName.left(dot);
    } else if (originalName.isEmpty()) {
        baseName = "image";
    } else {
        baseName = originalName;
    }
    return QString("%1_optimized.%2").arg(baseName, FormatRegistry::extension(format));
}

}
