
#include "Settings.h"
#include "Util/Environment.h"

#include <QSettings>
#include <QStandardPaths>
#include <QtDebug>
#include <QtGlobal>

#include <type_traits>

#include <gsl/gsl>

namespace Settings {

namespace {

constexpr auto DefaultStrategy  = RegVM::Strategy::Parallel;
constexpr auto DefaultAnchoring = RegVM::Anchoring::Full;
constexpr int DefaultStepLimit  = 1000000;
constexpr int DefaultCacheSize  = 64;

bool settingsLoaded_ = false;

template <class T>
using IsEnum = std::enable_if_t<std::is_enum_v<T>>;

template <class T, class = IsEnum<T>>
T ReadEnum(QSettings &settings, const QString &key, const T &defaultValue = T()) {
	using U = std::underlying_type_t<T>;
	return FromInteger<T>(settings.value(key, static_cast<U>(defaultValue)).toInt());
}

template <class T, class = IsEnum<T>>
void WriteEnum(QSettings &settings, const QString &key, const T &value) {
	using U = std::underlying_type_t<T>;
	settings.setValue(key, static_cast<U>(value));
}

/**
 * @brief Reads a count which must not be negative.
 *
 * @param settings The settings to read from.
 * @param key The key to read.
 * @param defaultValue The value to use if the key is missing or invalid.
 * @return The count.
 */
int ReadCount(QSettings &settings, const QString &key, int defaultValue) {
	bool ok         = false;
	const int value = settings.value(key, defaultValue).toInt(&ok);
	if (!ok || value < 0) {
		qWarning("regvm: Invalid value for %s", qPrintable(key));
		return defaultValue;
	}

	return value;
}

/**
 * @brief Returns the configuration directory.
 *
 * @return The path to the configuration directory.
 *
 * @note If the environment variable `REGVM_HOME` is set,
 * it will be used as the configuration directory.
 */
QString ConfigDirectory() {
	static const QString regvm_home = GetEnvironmentVariable("REGVM_HOME");
	if (!regvm_home.isEmpty()) {
		return regvm_home;
	}

	static const QString configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
	static const auto filename     = QStringLiteral("%1/regvm").arg(configDir);
	return filename;
}

}

RegVM::Strategy strategy   = DefaultStrategy;
RegVM::Anchoring anchoring = DefaultAnchoring;
int stepLimit              = DefaultStepLimit;
int cacheSize              = DefaultCacheSize;

/**
 * @brief Returns the path to the configuration file.
 *
 * @return The path to the configuration file.
 */
QString ConfigFile() {
	static const QString configDir = ConfigDirectory();
	static const auto filename     = QStringLiteral("%1/config.ini").arg(configDir);
	return filename;
}

/**
 * @brief Loads the settings from the default configuration file, once.
 */
void Load() {

	if (settingsLoaded_) {
		return; // Already loaded
	}

	Load(ConfigFile());
	settingsLoaded_ = true;
}

/**
 * @brief Loads the settings from `filename`. Missing keys take their
 * default values.
 *
 * @param filename The path to the settings file.
 */
void Load(const QString &filename) {
	QSettings settings(filename, QSettings::IniFormat);

	strategy  = ReadEnum(settings, QLatin1String("regvm.strategy"), DefaultStrategy);
	anchoring = ReadEnum(settings, QLatin1String("regvm.anchoring"), DefaultAnchoring);
	stepLimit = ReadCount(settings, QLatin1String("regvm.stepLimit"), DefaultStepLimit);
	cacheSize = ReadCount(settings, QLatin1String("regvm.cacheSize"), DefaultCacheSize);

	qDebug("regvm: settings loaded from %s (strategy %s, anchoring %s, step limit %d, cache size %d)",
		   qPrintable(filename),
		   ToString(strategy).data(),
		   ToString(anchoring).data(),
		   stepLimit,
		   cacheSize);
}

/**
 * @brief Saves the settings to the default configuration file.
 *
 * @return `true` if the settings were saved successfully, `false` otherwise.
 */
bool Save() {
	return Save(ConfigFile());
}

/**
 * @brief Saves the settings to `filename`.
 *
 * @param filename The path to the settings file.
 * @return `true` if the settings were saved successfully, `false` otherwise.
 */
bool Save(const QString &filename) {
	QSettings settings(filename, QSettings::IniFormat);

	WriteEnum(settings, QLatin1String("regvm.strategy"), strategy);
	WriteEnum(settings, QLatin1String("regvm.anchoring"), anchoring);
	settings.setValue(QLatin1String("regvm.stepLimit"), stepLimit);
	settings.setValue(QLatin1String("regvm.cacheSize"), cacheSize);

	settings.sync();
	if (settings.status() != QSettings::NoError) {
		qWarning("regvm: Could not write settings to %s", qPrintable(filename));
		return false;
	}

	return true;
}

/**
 * @brief Restores every setting to its default value.
 */
void Reset() {
	strategy  = DefaultStrategy;
	anchoring = DefaultAnchoring;
	stepLimit = DefaultStepLimit;
	cacheSize = DefaultCacheSize;
}

/**
 * @brief Builds the evaluation options described by the current settings.
 *
 * @return The evaluation options.
 */
RegVM::EvalOptions CurrentEvalOptions() {
	RegVM::EvalOptions options;
	options.strategy  = strategy;
	options.anchoring = anchoring;
	options.stepLimit = gsl::narrow_cast<size_t>(stepLimit);
	return options;
}

}
