/**
 * @file imuskel_replay_main.cpp
 * @brief Replay a recorded sensor capture through calibration and retargeting
 *
 * Reads a JSON-lines capture (sample payloads and control commands stamped
 * with t_ms), drives a manual-clock session with it and writes:
 *   - the corrected record stream as CSV (label,w,x,y,z,timestamp)
 *   - the final joint pose as YAML
 *
 * Usage:
 *   imuskel_replay -i data/capture/tpose_then_raise.jsonl -c data/config/replay.yaml
 *   imuskel_replay -i capture.jsonl --skeleton data/skeleton/ybot.yaml --duration 5000 -o out.csv -p pose.yaml -v
 */

#include "imuskel/imuskel.hpp"
#include "imuskel/link/capture_log.hpp"
#include "imuskel/link/channel.hpp"
#include "imuskel/link/record.hpp"

#include <boost/program_options.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

// Records the tokens a live transport would have sent
class LoggingSender : public imuskel::link::CommandSender {
public:
    bool send(const std::string& label, const std::string& token) override {
        LOG_VERBOSE("[Replay] -> " << label << ": " << token);
        return true;
    }
};

void printChannelSummary(imuskel::link::SensorHub& hub) {
    std::cout << std::left << std::setw(8) << "label"
              << std::right << std::setw(10) << "samples"
              << std::setw(10) << "dropped"
              << std::setw(8) << "gaps"
              << std::setw(10) << "missed" << std::endl;
    for (const auto& label : hub.labels()) {
        auto ch = hub.channel(label);
        if (!ch) continue;
        auto st = ch->stats();
        std::cout << std::left << std::setw(8) << label
                  << std::right << std::setw(10) << st.samples
                  << std::setw(10) << st.anomalies()
                  << std::setw(8) << st.sequence_gaps
                  << std::setw(10) << st.missed_samples << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    po::options_description desc("IMU Capture Replay");
    desc.add_options()
        ("help,h", "Show help")
        ("input,i", po::value<std::string>(), "Capture log (JSON lines)")
        ("config,c", po::value<std::string>(), "Session config YAML")
        ("skeleton,s", po::value<std::string>(), "Skeleton YAML (overrides config; default: built-in biped)")
        ("duration,d", po::value<long long>(), "Calibration window in ms (overrides config)")
        ("averaging,a", po::value<std::string>(), "aligned_mean | eigenvector (overrides config)")
        ("live-during-collection", po::bool_switch(), "Keep correcting while a calibration collects")
        ("calibrate-at", po::value<long long>(), "Start a calibration at this t_ms (in addition to logged commands)")
        ("output,o", po::value<std::string>(), "Corrected record CSV (default: <input>.corrected.csv)")
        ("with-count", po::bool_switch(), "Prefix CSV rows with the sensor count")
        ("pose,p", po::value<std::string>(), "Final pose YAML (default: <input>.pose.yaml)")
        ("verbose,v", po::bool_switch(), "Verbose output");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help") || !vm.count("input")) {
        std::cout << "IMU Capture Replay\n\n";
        std::cout << "Replays a recorded capture through calibration and retargeting.\n\n";
        std::cout << "Usage: " << argv[0] << " -i <capture.jsonl> [-c <session.yaml>]\n\n";
        std::cout << desc << std::endl;
        std::cout << "\nExamples:\n";
        std::cout << "  " << argv[0] << " -i data/capture/tpose_then_raise.jsonl -c data/config/replay.yaml\n";
        std::cout << "  " << argv[0] << " -i capture.jsonl --duration 5000 --calibrate-at 0 -v\n";
        return vm.count("help") ? 0 : 1;
    }

    const std::string inputPath = vm["input"].as<std::string>();
    const bool verbose = vm["verbose"].as<bool>();

    if (!fs::exists(inputPath)) {
        std::cerr << "Error: Input file does not exist: " << inputPath << std::endl;
        return 1;
    }

    const std::string csvPath = vm.count("output") ? vm["output"].as<std::string>()
                                                   : inputPath + ".corrected.csv";
    const std::string posePath = vm.count("pose") ? vm["pose"].as<std::string>()
                                                  : inputPath + ".pose.yaml";

    try {
        imuskel::SessionConfig config;
        if (vm.count("config")) {
            config = imuskel::SessionConfig::load(vm["config"].as<std::string>());
        }
        // Replay always follows the capture clock
        config.options.timer = imuskel::TimerMode::Manual;
        if (vm.count("skeleton")) {
            config.skeleton_path = vm["skeleton"].as<std::string>();
        }
        if (vm.count("duration")) {
            long long ms = vm["duration"].as<long long>();
            if (ms <= 0) {
                std::cerr << "Error: --duration must be positive" << std::endl;
                return 1;
            }
            config.options.calibration.duration = std::chrono::milliseconds(ms);
        }
        if (vm.count("averaging")) {
            config.options.calibration.averaging =
                imuskel::parse_averaging_method(vm["averaging"].as<std::string>());
        }
        if (vm["live-during-collection"].as<bool>()) {
            config.options.live_during_collection = true;
        }

        std::shared_ptr<imuskel::SkeletonModel> model =
            config.skeleton_path.empty() ? imuskel::SkeletonModel::standard_biped()
                                         : imuskel::SkeletonModel::load(config.skeleton_path.string());

        if (verbose) {
            std::cout << "Input: " << inputPath << std::endl;
            std::cout << "Skeleton: " << model->name() << " (" << model->size() << " joints)" << std::endl;
            std::cout << "Calibration window: " << config.options.calibration.duration.count() << "ms" << std::endl;
            std::cout << "Output: " << csvPath << ", " << posePath << std::endl;
        }

        imuskel::CaptureSession session(model, config.options);
        imuskel::link::CsvRecordWriter writer(csvPath, vm["with-count"].as<bool>());
        session.set_record_listener(writer.listener());
        session.set_calibration_listener([](const imuskel::CalibrationResult& result) {
            std::cout << "Calibration #" << result.collection_id << " complete: "
                      << result.references.size() << " references" << std::endl;
        });

        LoggingSender sender;
        imuskel::link::SensorHub hub(session, &sender);

        bool pendingCalibrate = vm.count("calibrate-at") > 0;
        const long long calibrateAt = pendingCalibrate ? vm["calibrate-at"].as<long long>() : 0;

        imuskel::link::CaptureReader reader(inputPath);
        imuskel::link::CaptureEvent event;
        int64_t lastT = 0;
        while (reader.next(event)) {
            const imuskel::TimePoint now = imuskel::from_millis(event.t_ms);
            lastT = event.t_ms;
            session.advance(now);

            if (pendingCalibrate && event.t_ms >= calibrateAt) {
                pendingCalibrate = false;
                hub.calibrate_all(imuskel::from_millis(calibrateAt));
            }

            if (event.kind == imuskel::link::CaptureEvent::Kind::Command) {
                if (event.command == imuskel::link::ControlCommand::Calibrate) {
                    hub.calibrate_all(now);
                } else {
                    hub.broadcast(event.command);
                }
                continue;
            }

            auto channel = hub.channel(event.channel);
            if (!channel) {
                channel = hub.add_channel(event.channel);
                channel->on_open();
            }
            channel->on_message(event.payload, now);
        }

        // Let a calibration still collecting at end of log run out its window
        if (session.calibration_state() == imuskel::CalibrationState::Collecting) {
            auto left = session.calibration_remaining(imuskel::from_millis(lastT));
            LOG_WARN("[Replay] Capture ended " << left.count() << "ms before the calibration window closed");
            session.advance(imuskel::from_millis(lastT) + left);
        }

        writer.flush();
        imuskel::write_pose_yaml(posePath, imuskel::session_pose_to_yaml(session, fs::path(inputPath).filename().string()));

        auto stats = session.stats();
        std::cout << "Replayed " << reader.lines() << " lines (" << reader.skipped() << " skipped)" << std::endl;
        std::cout << "Samples: " << stats.samples_delivered << " delivered, "
                  << stats.samples_collected << " collected, "
                  << stats.samples_live << " live, "
                  << stats.unmapped_samples << " unmapped, "
                  << stats.degenerate_samples << " degenerate" << std::endl;
        if (verbose) {
            printChannelSummary(hub);
        }
        std::cout << "Exported: " << csvPath << " (" << writer.rows() << " rows)" << std::endl;
        std::cout << "Exported: " << posePath << std::endl;
    } catch (const imuskel::Error& e) {
        LOG_ERROR(e.what());
        return 1;
    }
    return 0;
}
