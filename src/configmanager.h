#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QDir>

struct AppConfig {
    QString outputDirectory;
    QString format;             // "auto" or a format name
    double quality;
    int maxWidth;               // 0 = unbounded
    int maxHeight;
    bool targetSizeEnabled;
    int targetSizeKB;
    double searchTolerance;

    // Scheduling
    int maxConcurrency;         // 0 = automatic
    int minWorkers;
    bool warmupEnabled;

    // Default values
    AppConfig() :
        outputDirectory(QDir::homePath() + "/Pictures/PixelPress"),
        format("auto"),
        quality(0.8),
        maxWidth(0),
        maxHeight(0),
        targetSizeEnabled(false),
        targetSizeKB(100),
        searchTolerance(0.9),
        maxConcurrency(0),
        minWorkers(0),
        warmupEnabled(true)
    {}
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Use the per-user settings store
     */
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an INI file instead of the per-user store
     * @param iniPath Path to the INI file
     */
    explicit ConfigManager(const QString& iniPath, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     * @return AppConfig structure with loaded settings
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AppConfig& config);

    /**
     * Location of the backing store
     */
    QString fileName() const;

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_OUTPUT_DIR;
    static const QString KEY_FORMAT;
    static const QString KEY_QUALITY;
    static const QString KEY_MAX_WIDTH;
    static const QString KEY_MAX_HEIGHT;
    static const QString KEY_TARGET_SIZE_ENABLED;
    static const QString KEY_TARGET_SIZE_KB;
    static const QString KEY_SEARCH_TOLERANCE;
    static const QString KEY_MAX_CONCURRENCY;
    static const QString KEY_MIN_WORKERS;
    static const QString KEY_WARMUP_ENABLED;
};

#endif // CONFIGMANAGER_H
