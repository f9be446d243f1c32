#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QStringList>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "core/config/ConfigLoader.hpp"
#include "core/config/EngineConfig.hpp"
#include "core/correction/CorrectionEngine.hpp"
#include "core/input/SampleTrace.hpp"
#include "core/motion/MotionSmoother.hpp"
#include "utils/Logger.hpp"

namespace {

std::string formatVector(const st::Vector3 &v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << v;
    return ss.str();
}

void printSuggestions(st::CorrectionEngine &engine, const std::string &word) {
    const std::vector<std::string> suggestions = engine.suggest(word);
    std::cout << word << " ->";
    if (suggestions.empty()) {
        std::cout << " (no suggestion)" << std::endl;
        return;
    }
    for (const auto &s : suggestions) {
        std::ostringstream confidence;
        confidence << std::fixed << std::setprecision(2) << engine.confidence(word, s);
        std::cout << ' ' << s << " (" << confidence.str() << ')';
    }
    std::cout << std::endl;
}

bool replayTrace(st::MotionSmoother &smoother, const st::SampleTrace &trace, bool jitter,
                 bool rejectOutliers, st::SampleTrace &smoothed) {
    for (const auto &sample : trace.samples()) {
        st::Vector3 position = sample.position;
        if (rejectOutliers)
            position = smoother.applyOutlierRejection(position);
        if (jitter)
            position = smoother.applyJitterReduction(position);
        const st::Vector3 out = smoother.update(position, sample.timestamp);
        smoothed.addSample({out, sample.timestamp});
    }
    return !smoothed.empty();
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("spatialtext-cli"));
    QCommandLineParser parser;
    parser.setApplicationDescription("SpatialText correction and motion smoothing tool");
    parser.addHelpOption();

    QCommandLineOption configOpt({"c", "config"}, "JSON configuration file", "file");
    QCommandLineOption suggestOpt({"s", "suggest"}, "Word to correct (repeatable)", "word");
    QCommandLineOption contextOpt({"n", "next-after"},
        "Print likely next words after this word", "word");
    QCommandLineOption traceOpt({"t", "trace"}, "CSV trace of x,y,z,t samples to smooth", "csv");
    QCommandLineOption outputOpt({"o", "output"}, "Write smoothed samples to this CSV", "csv");
    QCommandLineOption predictOpt({"p", "predict"},
        "Predict the position this many seconds after the last sample", "seconds");
    QCommandLineOption calibrateOpt({"C", "calibrate"},
        "Calibrate measurement noise from the first N trace samples", "count", "0");
    QCommandLineOption jitterOpt({"j", "jitter"}, "Median-filter samples before smoothing");
    QCommandLineOption outlierOpt({"r", "reject-outliers"},
        "Replace outlying samples with the recent mean before smoothing");

    parser.addOption(configOpt);
    parser.addOption(suggestOpt);
    parser.addOption(contextOpt);
    parser.addOption(traceOpt);
    parser.addOption(outputOpt);
    parser.addOption(predictOpt);
    parser.addOption(calibrateOpt);
    parser.addOption(jitterOpt);
    parser.addOption(outlierOpt);
    parser.addPositionalArgument("words", "Additional words to correct", "[words...]");

    parser.process(app);

    // These only act on a replayed trace.
    const QCommandLineOption traceOnlyOptions[] = {outputOpt, predictOpt, calibrateOpt, jitterOpt,
                                                    outlierOpt};
    if (!parser.isSet(traceOpt)) {
        for (const QCommandLineOption &opt : traceOnlyOptions) {
            if (parser.isSet(opt)) {
                std::cerr << "--" << opt.names().constLast().toStdString() << " requires --trace"
                          << std::endl;
                return 1;
            }
        }
    }

    st::EngineSettings settings;
    if (parser.isSet(configOpt)) {
        st::ConfigLoader loader;
        QString error;
        if (!loader.loadFile(parser.value(configOpt), settings, &error)) {
            std::cerr << "Failed to load configuration: " << error.toStdString() << std::endl;
            return 1;
        }
    }

    QStringList words = parser.values(suggestOpt);
    words << parser.positionalArguments();

    try {
        st::CorrectionEngine engine(settings.correction, settings.lexicon);
        for (const QString &word : words)
            printSuggestions(engine, word.toStdString());
        if (parser.isSet(contextOpt)) {
            const std::string previous = parser.value(contextOpt).toStdString();
            std::cout << previous << " ...";
            for (const auto &next : engine.nextWordSuggestions({previous}))
                std::cout << ' ' << next;
            std::cout << std::endl;
        }

        if (!parser.isSet(traceOpt))
            return 0;

        const std::string tracePath = parser.value(traceOpt).toStdString();
        st::SampleTrace trace;
        if (!trace.loadCSV(tracePath)) {
            std::cerr << "Failed to read trace " << tracePath << std::endl;
            return 1;
        }
        ST_LOG(st::LogLevel::Info, "Replaying " + std::to_string(trace.size()) + " samples from " + tracePath);

        st::MotionSmoother smoother(settings.smoother);
        bool countOk = false;
        const int calibrationCount = parser.value(calibrateOpt).toInt(&countOk);
        if (!countOk || calibrationCount < 0) {
            std::cerr << "Invalid calibration count" << std::endl;
            return 1;
        }
        if (calibrationCount > 0) {
            std::vector<st::Vector3> positions = trace.positions();
            if (positions.size() > static_cast<size_t>(calibrationCount))
                positions.resize(static_cast<size_t>(calibrationCount));
            smoother.calibrate(positions);
        }

        st::SampleTrace smoothed;
        if (!replayTrace(smoother, trace, parser.isSet(jitterOpt), parser.isSet(outlierOpt), smoothed)) {
            ST_LOG(st::LogLevel::Warn, "Trace " + tracePath + " contains no samples");
            return 0;
        }

        if (parser.isSet(outputOpt)) {
            const std::string outPath = parser.value(outputOpt).toStdString();
            if (!smoothed.exportCSV(outPath)) {
                std::cerr << "Failed to write " << outPath << std::endl;
                return 1;
            }
        } else {
            for (const auto &s : smoothed.samples()) {
                std::cout << s.position.x << ',' << s.position.y << ',' << s.position.z << ','
                          << s.timestamp << '\n';
            }
            std::cout.flush();
        }

        const st::MotionDebugInfo info = smoother.debugInfo();
        ST_LOG(st::LogLevel::Info, "Final position " + formatVector(info.smoothedPosition) +
                                       ", velocity " + formatVector(info.velocity) +
                                       (info.stable ? ", stable" : ", not stable"));
        if (parser.isSet(predictOpt)) {
            bool ok = false;
            const float offset = parser.value(predictOpt).toFloat(&ok);
            if (!ok) {
                std::cerr << "Invalid prediction offset" << std::endl;
                return 1;
            }
            std::cout << "predicted(" << offset << "s) " << formatVector(smoother.predict(offset))
                      << std::endl;
        }
    } catch (const st::ConfigError &e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
