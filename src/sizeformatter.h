#ifndef SIZEFORMATTER_H
#define SIZEFORMATTER_H

#include "formatregistry.h"
#include <QString>

/**
 * Human readable sizes and compression figures for reports
 */
namespace SizeFormatter {

/**
 * Format a byte count with 1024-based units, up to two decimals ("1.5 KB").
 * Negative counts keep their sign; zero is "0 Bytes".
 */
QString formatFileSize(qint64 bytes);

/**
 * Bytes saved, formatted (negative when the result grew)
 */
QString savings(qint64 originalSize, qint64 optimizedSize);

/**
 * Rounded percentage saved, negative when the result grew, 0 for an empty original
 */
int compressionPercentage(qint64 originalSize, qint64 optimizedSize);

/**
 * "N% smaller" or "N% larger"
 */
QString compressionLabel(qint64 originalSize, qint64 optimizedSize);

/**
 * "<name>_optimized.<ext>" with the original extension stripped
 */
QString optimizedFileName(const QString& originalName, ImageFormat format);

}

#endif // SIZEFORMATTER_H
