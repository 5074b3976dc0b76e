#include "Application.hpp"
#include <QCommandLineParser>
#include <QTimer>
#include "Config.hpp"
#include "Logger.hpp"
#include "capture/ChannelAcquirer.hpp"
#include "dispatch/Dispatcher.hpp"
#include "dispatch/RecordingStore.hpp"
#include "dispatch/StdioTransport.hpp"
#include "interaction/SignalCapturer.hpp"
#include "platform/linux/LinuxMediaBackend.hpp"
#include "recorder/FFmpegChannelRecorder.hpp"
#include "recorder/RecorderOrchestrator.hpp"
#include "ui/CaptureWindow.hpp"
#include "util/FileUtils.hpp"

namespace smu {

Application::Application(int& argc, char** argv)
    : qapp_(std::make_unique<QApplication>(argc, argv)) {
    QCoreApplication::setApplicationName("screenmu-capture");
    QCoreApplication::setApplicationVersion("0.1.0");
    // Closing the window goes through onInputClosed so a running session
    // is finalized before quitting
    qapp_->setQuitOnLastWindowClosed(false);
}

Application::~Application() {
    window_.reset();
    transport_.reset();
    dispatcher_.reset();
    capturer_.reset();
    orchestrator_.reset();
    Logger::shutdown();
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Screen, microphone and camera capture with synchronized "
            "interaction signals");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(
            {"c", "config"}, "Configuration file", "path");
    QCommandLineOption debugOption({"d", "debug"}, "Enable debug logging");
    QCommandLineOption probeOption(
            "probe-permissions",
            "Probe microphone and camera access at startup");
    QCommandLineOption startOption("start", "Start capturing immediately");
    QCommandLineOption windowOption("window", "Capture the control window");
    QCommandLineOption monitorOption("monitor", "Capture the whole monitor");
    parser.addOptions({configOption,
                       debugOption,
                       probeOption,
                       startOption,
                       windowOption,
                       monitorOption});

    if (!parser.parse(QCoreApplication::arguments())) {
        return Result<AppOptions>::err(parser.errorText().toStdString(),
                                       ErrorCode::InvalidArgument);
    }
    if (parser.isSet("help"))
        parser.showHelp(0);
    if (parser.isSet("version"))
        parser.showVersion();

    if (parser.isSet(windowOption) && parser.isSet(monitorOption)) {
        return Result<AppOptions>::err(
                "--window and --monitor are mutually exclusive",
                ErrorCode::InvalidArgument);
    }

    AppOptions opts;
    if (parser.isSet(configOption))
        opts.configPath = file::expandPath(
                parser.value(configOption).toStdString());
    opts.debug = parser.isSet(debugOption);
    opts.probePermissions = parser.isSet(probeOption);
    opts.startImmediately = parser.isSet(startOption);
    if (parser.isSet(windowOption))
        opts.displayIntent = DisplayIntent::Window;
    else if (parser.isSet(monitorOption))
        opts.displayIntent = DisplayIntent::Monitor;

    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    Logger::init("screenmu-capture", opts.debug);
    LOG_INFO("ScreenMu Capture {} starting",
             QCoreApplication::applicationVersion().toStdString());

    if (opts.configPath) {
        auto loaded = CONFIG.load(*opts.configPath);
        if (!loaded)
            return loaded;
    } else if (auto loaded = CONFIG.loadDefault(); !loaded) {
        LOG_WARN("Using built-in defaults: {}", loaded.error().message);
    }

    if (opts.debug)
        CONFIG.setDebug(true);
    Logger::setDebug(CONFIG.debug());

    setupComponents(opts);
    setupConnections();

    if (opts.probePermissions) {
        auto permissions = acquirer_->probePermissions();
        dispatcher_->setPermissions(permissions);
        transport_->send(ControlMessages::permissionsResult(permissions));
    }

    if (opts.startImmediately) {
        QTimer::singleShot(0, qapp_.get(), [this] {
            ControlMessage msg;
            msg.type = MessageType::StartCapture;
            submit(msg);
        });
    }

    return Result<void>::ok();
}

void Application::setupComponents(const AppOptions& opts) {
    const Config& cfg = CONFIG;

    window_ = std::make_unique<CaptureWindow>();
    window_->show();

    backend_ = std::make_unique<LinuxMediaBackend>();
    backend_->setTargetWindow(window_->windowHandle());

    acquirer_ = std::make_unique<ChannelAcquirer>(
            *backend_,
            AcquirerSettings{cfg.display(), cfg.microphone(), cfg.camera()});
    recorderFactory_ = std::make_unique<FFmpegRecorderFactory>();
    orchestrator_ = std::make_unique<RecorderOrchestrator>(
            *acquirer_,
            *recorderFactory_,
            OrchestratorSettings::fromConfig(cfg.recording(),
                                             cfg.display(),
                                             cfg.microphone(),
                                             cfg.camera()));

    capturer_ = std::make_unique<SignalCapturer>(
            SignalCapturerSettings::fromConfig(cfg.interaction()));
    capturer_->attach(window_->windowHandle());

    DispatcherSettings ds;
    ds.defaultWantMicrophone = cfg.recording().wantMicrophone;
    ds.defaultWantCamera = cfg.recording().wantCamera;
    ds.defaultDisplayIntent =
            opts.displayIntent.value_or(parseDisplayIntent(cfg.display().intent)
                                                .value_or(DisplayIntent::Monitor));
    dispatcher_ = std::make_unique<Dispatcher>(*orchestrator_, *capturer_, ds);

    if (cfg.output().saveToDisk) {
        fs::path dir = cfg.output().directory;
        if (dir.empty())
            dir = file::expandPath("~/Videos/ScreenMu");
        store_ = std::make_unique<RecordingStore>(dir);
    }

    transport_ = std::make_unique<StdioTransport>();
}

void Application::setupConnections() {
    transport_->lineReceived.connect([this](const QByteArray& line) {
        dispatcher_->handleLine(line, [this](const QJsonObject& reply) {
            transport_->send(reply);
        });
    });
    transport_->closed.connect([this] { onInputClosed(); });
    QObject::connect(qapp_.get(), &QGuiApplication::lastWindowClosed,
                     qapp_.get(), [this] { onInputClosed(); });

    dispatcher_->signalBatch.connect([this](const SignalBatch& batch) {
        transport_->send(ControlMessages::signalBatch(batch));
    });
    dispatcher_->recordingFinished.connect(
            [this](const CompletedRecording& recording) {
                onRecordingFinished(recording);
            });

    window_->setStatusSource([this] { return dispatcher_->status(); });

    auto request = [this](MessageType type) {
        return [this, type] {
            ControlMessage msg;
            msg.type = type;
            submit(msg);
        };
    };
    QObject::connect(window_.get(), &CaptureWindow::startRequested, qapp_.get(),
                     request(MessageType::StartCapture));
    QObject::connect(window_.get(), &CaptureWindow::pauseRequested, qapp_.get(),
                     request(MessageType::PauseCapture));
    QObject::connect(window_.get(), &CaptureWindow::resumeRequested, qapp_.get(),
                     request(MessageType::ResumeCapture));
    QObject::connect(window_.get(), &CaptureWindow::stopRequested, qapp_.get(),
                     request(MessageType::StopCapture));
}

void Application::submit(const ControlMessage& msg) {
    dispatcher_->handle(msg, [this](const QJsonObject& reply) {
        transport_->send(reply);
        if (!reply["success"].toBool() && window_)
            window_->showError(reply["error"].toString());
    });
}

void Application::onRecordingFinished(const CompletedRecording& recording) {
    const bool embed = CONFIG.output().embedPayloads;
    for (const auto& artifact : recording.artifacts) {
        transport_->send(ControlMessages::artifact(artifact, embed));
    }

    if (store_) {
        auto saved = store_->save(recording);
        if (!saved)
            LOG_ERROR("Failed to save recording: {}", saved.error().message);
    }

    if (quitAfterStop_)
        QTimer::singleShot(0, qapp_.get(), &QCoreApplication::quit);
}

void Application::onInputClosed() {
    auto state = orchestrator_->state();
    if (state == SessionState::Recording || state == SessionState::Paused) {
        LOG_INFO("Input closed while recording, stopping");
        quitAfterStop_ = true;
        ControlMessage msg;
        msg.type = MessageType::StopCapture;
        submit(msg);
        return;
    }
    if (state == SessionState::Stopping) {
        quitAfterStop_ = true;
        return;
    }
    QTimer::singleShot(0, qapp_.get(), &QCoreApplication::quit);
}

int Application::exec() {
    int rc = qapp_->exec();
    LOG_INFO("Event loop finished ({})", rc);
    return rc;
}

} // namespace smu
