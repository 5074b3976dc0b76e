#include "CaptureWindow.hpp"
#include <QGridLayout>
#include <QHBoxLayout>
#include <QStringList>
#include <QVBoxLayout>

namespace smu {

namespace {
QString formatDuration(i64 ms) {
    const i64 totalSeconds = ms / 1000;
    return QString("%1:%2.%3")
            .arg(totalSeconds / 60, 2, 10, QChar('0'))
            .arg(totalSeconds % 60, 2, 10, QChar('0'))
            .arg((ms % 1000) / 100);
}
} // namespace

CaptureWindow::CaptureWindow(QWidget* parent) : QWidget(parent) {
    setWindowTitle("ScreenMu Capture");
    setupUI();
    updateStatus({});

    pollTimer_.setInterval(250);
    connect(&pollTimer_, &QTimer::timeout, this, [this] {
        if (statusSource_)
            updateStatus(statusSource_());
    });
}

void CaptureWindow::setStatusSource(std::function<CaptureStatus()> source) {
    statusSource_ = std::move(source);
    if (statusSource_) {
        updateStatus(statusSource_());
        pollTimer_.start();
    } else {
        pollTimer_.stop();
    }
}

void CaptureWindow::setupUI() {
    auto* layout = new QVBoxLayout(this);

    statusLabel_ = new QLabel();
    statusLabel_->setStyleSheet("font-weight: bold;");
    layout->addWidget(statusLabel_);

    auto* grid = new QGridLayout();
    grid->addWidget(new QLabel("Duration:"), 0, 0);
    timeLabel_ = new QLabel();
    grid->addWidget(timeLabel_, 0, 1);
    grid->addWidget(new QLabel("Channels:"), 1, 0);
    channelsLabel_ = new QLabel();
    grid->addWidget(channelsLabel_, 1, 1);
    grid->addWidget(new QLabel("Signals:"), 2, 0);
    signalsLabel_ = new QLabel();
    grid->addWidget(signalsLabel_, 2, 1);
    layout->addLayout(grid);

    errorLabel_ = new QLabel();
    errorLabel_->setStyleSheet("color: #c0392b;");
    errorLabel_->setWordWrap(true);
    errorLabel_->hide();
    layout->addWidget(errorLabel_);

    auto* buttons = new QHBoxLayout();
    recordButton_ = new QPushButton("Start");
    recordButton_->setMinimumHeight(36);
    connect(recordButton_, &QPushButton::clicked, this,
            &CaptureWindow::onRecordButtonClicked);
    buttons->addWidget(recordButton_);

    pauseButton_ = new QPushButton("Pause");
    pauseButton_->setMinimumHeight(36);
    connect(pauseButton_, &QPushButton::clicked, this,
            &CaptureWindow::onPauseButtonClicked);
    buttons->addWidget(pauseButton_);
    layout->addLayout(buttons);

    layout->addStretch();
    setMinimumSize(320, 180);
}

void CaptureWindow::updateStatus(const CaptureStatus& status) {
    current_ = status;

    if (status.isPaused) {
        statusLabel_->setText("Paused");
    } else if (status.isRecording) {
        statusLabel_->setText("Recording");
    } else {
        statusLabel_->setText("Idle");
    }

    timeLabel_->setText(formatDuration(status.durationMs));
    signalsLabel_->setText(QString::number(status.signalCount));

    QStringList names;
    for (auto kind : status.channels) {
        auto name = toString(kind);
        names << QString::fromUtf8(name.data(), static_cast<qsizetype>(name.size()));
    }
    channelsLabel_->setText(names.isEmpty() ? QString("-") : names.join(", "));

    recordButton_->setText(status.isRecording ? "Stop" : "Start");
    pauseButton_->setEnabled(status.isRecording);
    pauseButton_->setText(status.isPaused ? "Resume" : "Pause");
}

// Stays up until the next button press; status polling does not clear it
void CaptureWindow::showError(const QString& message) {
    errorLabel_->setText(message);
    errorLabel_->show();
}

void CaptureWindow::onRecordButtonClicked() {
    errorLabel_->hide();
    if (current_.isRecording)
        emit stopRequested();
    else
        emit startRequested();
}

void CaptureWindow::onPauseButtonClicked() {
    if (!current_.isRecording)
        return;
    errorLabel_->hide();
    if (current_.isPaused)
        emit resumeRequested();
    else
        emit pauseRequested();
}

} // namespace smu
