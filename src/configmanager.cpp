#include "configmanager.h"
#include <QDebug>

// Configuration keys
const QString ConfigManager::KEY_OUTPUT_DIR = "outputDirectory";
const QString ConfigManager::KEY_FORMAT = "format";
const QString ConfigManager::KEY_QUALITY = "quality";
const QString ConfigManager::KEY_MAX_WIDTH = "maxWidth";
const QString ConfigManager::KEY_MAX_HEIGHT = "maxHeight";
const QString ConfigManager::KEY_TARGET_SIZE_ENABLED = "targetSizeEnabled";
const QString ConfigManager::KEY_TARGET_SIZE_KB = "targetSizeKB";
const QString ConfigManager::KEY_SEARCH_TOLERANCE = "searchTolerance";
const QString ConfigManager::KEY_MAX_CONCURRENCY = "maxConcurrency";
const QString ConfigManager::KEY_MIN_WORKERS = "minWorkers";
const QString ConfigManager::KEY_WARMUP_ENABLED = "warmupEnabled";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    // On Linux this is ~/.config/PixelPress/PixelPress.conf
    m_settings = new QSettings("PixelPress", "PixelPress", this);
}

ConfigManager::ConfigManager(const QString& iniPath, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(iniPath, QSettings::IniFormat, this);
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "ConfigManager: Could not read" << iniPath << "- using defaults";
    }
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;

    config.outputDirectory = m_settings->value(KEY_OUTPUT_DIR, config.outputDirectory).toString();
    config.format = m_settings->value(KEY_FORMAT, config.format).toString().toLower();
    config.quality = m_settings->value(KEY_QUALITY, config.quality).toDouble();
    config.maxWidth = m_settings->value(KEY_MAX_WIDTH, config.maxWidth).toInt();
    config.maxHeight = m_settings->value(KEY_MAX_HEIGHT, config.maxHeight).toInt();
    config.targetSizeEnabled = m_settings->value(KEY_TARGET_SIZE_ENABLED, config.targetSizeEnabled).toBool();
    config.targetSizeKB = m_settings->value(KEY_TARGET_SIZE_KB, config.targetSizeKB).toInt();
    config.searchTolerance = m_settings->value(KEY_SEARCH_TOLERANCE, config.searchTolerance).toDouble();

    // Scheduling
    config.maxConcurrency = m_settings->value(KEY_MAX_CONCURRENCY, config.maxConcurrency).toInt();
    config.minWorkers = m_settings->value(KEY_MIN_WORKERS, config.minWorkers).toInt();
    config.warmupEnabled = m_settings->value(KEY_WARMUP_ENABLED, config.warmupEnabled).toBool();

    return config;
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    m_settings->setValue(KEY_OUTPUT_DIR, config.outputDirectory);
    m_settings->setValue(KEY_FORMAT, config.format);
    m_settings->setValue(KEY_QUALITY, config.quality);
    m_settings->setValue(KEY_MAX_WIDTH, config.maxWidth);
    m_settings->setValue(KEY_MAX_HEIGHT, config.maxHeight);
    m_settings->setValue(KEY_TARGET_SIZE_ENABLED, config.targetSizeEnabled);
    m_settings->setValue(KEY_TARGET_SIZE_KB, config.targetSizeKB);
    m_settings->setValue(KEY_SEARCH_TOLERANCE, config.searchTolerance);

    m_settings->setValue(KEY_MAX_CONCURRENCY, config.maxConcurrency);
    m_settings->setValue(KEY_MIN_WORKERS, config.minWorkers);
    m_settings->setValue(KEY_WARMUP_ENABLED, config.warmupEnabled);

    m_settings->sync();
}

QString ConfigManager::fileName() const
{
    return m_settings->fileName();
}
