#pragma once

#include <cmath>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

#include "core/config/EngineConfig.hpp"
#include "core/correction/Lexicon.hpp"
#include "utils/Logger.hpp"

namespace st {

// Everything needed to build a CorrectionEngine and a MotionSmoother.
struct EngineSettings {
  CorrectionConfig correction;
  Lexicon lexicon = defaultLexicon();
  SmootherConfig smoother;
};

// Reads EngineSettings from JSON. Keys that are absent keep their current
// value; keys with the wrong type are skipped with a warning. Range checks are
// left to the config validate() calls made by the components.
class ConfigLoader {
public:
  bool loadFile(const QString &path, EngineSettings &settings, QString *error = nullptr) const {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
      setError(error, QStringLiteral("cannot open %1: %2").arg(path, file.errorString()));
      return false;
    }
    const QByteArray data = file.readAll();
    file.close();
    return loadJson(data, settings, error);
  }

  bool loadJson(const QByteArray &data, EngineSettings &settings, QString *error = nullptr) const {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
      setError(error, QStringLiteral("invalid JSON at offset %1: %2")
                          .arg(parseError.offset)
                          .arg(parseError.errorString()));
      return false;
    }
    if (!doc.isObject()) {
      setError(error, QStringLiteral("configuration root must be an object"));
      return false;
    }

    const QJsonObject root = doc.object();
    const QJsonValue correction = root.value(QStringLiteral("correction"));
    if (correction.isObject())
      readCorrection(correction.toObject(), settings);
    else if (!correction.isUndefined())
      warnType(QStringLiteral("correction"), "an object");

    const QJsonValue smoother = root.value(QStringLiteral("smoother"));
    if (smoother.isObject())
      readSmoother(smoother.toObject(), settings.smoother);
    else if (!smoother.isUndefined())
      warnType(QStringLiteral("smoother"), "an object");
    return true;
  }

private:
  using WordMap = std::unordered_map<std::string, std::vector<std::string>>;

  static void setError(QString *error, const QString &message) {
    ST_LOG(LogLevel::Error, "Configuration error: " + message.toStdString());
    if (error)
      *error = message;
  }

  static void warnType(const QString &key, const char *expected) {
    ST_LOG(LogLevel::Warn, "Ignoring \"" + key.toStdString() + "\": expected " + expected);
  }

  static void readCorrection(const QJsonObject &obj, EngineSettings &settings) {
    CorrectionConfig &config = settings.correction;
    readSize(obj, QStringLiteral("cacheCapacity"), config.cacheCapacity);
    readSize(obj, QStringLiteral("maxSuggestions"), config.maxSuggestions);
    readSize(obj, QStringLiteral("maxEditDistance"), config.maxEditDistance);
    readSize(obj, QStringLiteral("maxDictionaryEntries"), config.maxDictionaryEntries);
    readBool(obj, QStringLiteral("invalidateOnLearn"), config.invalidateOnLearn);

    readWordMap(obj, QStringLiteral("dictionary"), settings.lexicon.corrections);
    readWordMap(obj, QStringLiteral("nextWords"), settings.lexicon.nextWords);
    const QJsonValue words = obj.value(QStringLiteral("commonWords"));
    if (words.isArray())
      settings.lexicon.commonWords = toStringList(words.toArray(), QStringLiteral("commonWords"));
    else if (!words.isUndefined())
      warnType(QStringLiteral("commonWords"), "an array of strings");
  }

  static void readSmoother(const QJsonObject &obj, SmootherConfig &config) {
    readFloat(obj, QStringLiteral("predictionFactor"), config.predictionFactor);
    readFloat(obj, QStringLiteral("processNoise"), config.processNoise);
    readFloat(obj, QStringLiteral("measurementNoise"), config.measurementNoise);
    readFloat(obj, QStringLiteral("smoothingFactor"), config.smoothingFactor);
    readFloat(obj, QStringLiteral("stabilityThreshold"), config.stabilityThreshold);
    readSize(obj, QStringLiteral("historyCapacity"), config.historyCapacity);
    readFloat(obj, QStringLiteral("initialUncertainty"), config.initialUncertainty);
    readBool(obj, QStringLiteral("adaptiveSmoothing"), config.adaptiveSmoothing);
    readFloat(obj, QStringLiteral("fastSmoothingFactor"), config.fastSmoothingFactor);
    readFloat(obj, QStringLiteral("slowSmoothingFactor"), config.slowSmoothingFactor);

    const QJsonValue initial = obj.value(QStringLiteral("initialPosition"));
    if (initial.isUndefined())
      return;
    const QJsonArray array = initial.toArray();
    if (!initial.isArray() || array.size() != 3 || !array.at(0).isDouble() ||
        !array.at(1).isDouble() || !array.at(2).isDouble()) {
      warnType(QStringLiteral("initialPosition"), "an array of 3 numbers");
      return;
    }
    config.initialPosition = Vector3(static_cast<float>(array.at(0).toDouble()),
                                     static_cast<float>(array.at(1).toDouble()),
                                     static_cast<float>(array.at(2).toDouble()));
  }

  static void readFloat(const QJsonObject &obj, const QString &key, float &out) {
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
      return;
    const double number = value.toDouble();
    if (!value.isDouble() || std::fabs(number) > std::numeric_limits<float>::max()) {
      warnType(key, "a number in float range");
      return;
    }
    out = static_cast<float>(number);
  }

  static void readSize(const QJsonObject &obj, const QString &key, size_t &out) {
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
      return;
    // 2^64 itself does not fit, so the upper bound is exclusive.
    const double limit = static_cast<double>(std::numeric_limits<size_t>::max());
    const double number = value.toDouble(-1.0);
    if (!value.isDouble() || number < 0.0 || number >= limit || std::floor(number) != number) {
      warnType(key, "a non-negative integer in range");
      return;
    }
    out = static_cast<size_t>(number);
  }

  static void readBool(const QJsonObject &obj, const QString &key, bool &out) {
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
      return;
    if (!value.isBool()) {
      warnType(key, "a boolean");
      return;
    }
    out = value.toBool();
  }

  static void readWordMap(const QJsonObject &obj, const QString &key, WordMap &out) {
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
      return;
    if (!value.isObject()) {
      warnType(key, "an object of string arrays");
      return;
    }
    const QJsonObject map = value.toObject();
    WordMap words;
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
      // A single string is accepted as a one-element list.
      if (it.value().isString())
        words[it.key().toStdString()] = {it.value().toString().toStdString()};
      else if (it.value().isArray())
        words[it.key().toStdString()] =
            toStringList(it.value().toArray(), key + QLatin1Char('.') + it.key());
      else
        warnType(key + QLatin1Char('.') + it.key(), "a string or an array of strings");
    }
    out = std::move(words);
  }

  static std::vector<std::string> toStringList(const QJsonArray &array, const QString &key) {
    std::vector<std::string> list;
    list.reserve(static_cast<size_t>(array.size()));
    for (int i = 0; i < array.size(); ++i) {
      const QJsonValue entry = array.at(i);
      if (entry.isString())
        list.push_back(entry.toString().toStdString());
      else
        warnType(QStringLiteral("%1[%2]").arg(key).arg(i), "a string");
    }
    return list;
  }
};

} // namespace st
