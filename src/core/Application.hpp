/**
 * @file Application.hpp
 * @brief Process entry object: argument parsing, wiring and the event loop.
 *
 * Owns every long-lived component and connects them: the Linux device
 * backend, channel acquirer, recorder orchestrator, signal capturer,
 * dispatcher, recording store, stdio transport and the control window that
 * doubles as the observed surface.
 *
 * @section Dependencies
 * - Qt6 Widgets (QApplication, QCommandLineParser)
 * - Config, Logger
 *
 * @section Patterns
 * - Composition Root: the only place that knows concrete implementations.
 */

#pragma once
#include <QApplication>
#include <memory>
#include <optional>
#include "capture/CaptureTypes.hpp"
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace smu {

class LinuxMediaBackend;
class ChannelAcquirer;
class FFmpegRecorderFactory;
class RecorderOrchestrator;
class SignalCapturer;
class Dispatcher;
class RecordingStore;
class StdioTransport;
class CaptureWindow;
struct CompletedRecording;
struct ControlMessage;

struct AppOptions {
    std::optional<fs::path> configPath;
    bool debug{false};
    bool probePermissions{false};
    bool startImmediately{false};
    std::optional<DisplayIntent> displayIntent;
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

private:
    void setupComponents(const AppOptions& opts);
    void setupConnections();
    void submit(const ControlMessage& msg);
    void onRecordingFinished(const CompletedRecording& recording);
    void onInputClosed();

    std::unique_ptr<QApplication> qapp_;

    std::unique_ptr<LinuxMediaBackend> backend_;
    std::unique_ptr<ChannelAcquirer> acquirer_;
    std::unique_ptr<FFmpegRecorderFactory> recorderFactory_;
    std::unique_ptr<RecorderOrchestrator> orchestrator_;
    std::unique_ptr<SignalCapturer> capturer_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<RecordingStore> store_;
    std::unique_ptr<StdioTransport> transport_;
    std::unique_ptr<CaptureWindow> window_;

    bool quitAfterStop_{false};
};

} // namespace smu
