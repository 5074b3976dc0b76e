#pragma once
// CaptureWindow.hpp - Control window and default observed surface
// Shows the session status; its buttons issue the same requests as the
// control channel.

#include <QLabel>
#include <QPushButton>
#include <QTimer>
#include <QWidget>
#include <functional>
#include "dispatch/ControlMessages.hpp"

namespace smu {

class CaptureWindow : public QWidget {
    Q_OBJECT

public:
    explicit CaptureWindow(QWidget* parent = nullptr);

    // Polled while visible
    void setStatusSource(std::function<CaptureStatus()> source);

signals:
    void startRequested();
    void pauseRequested();
    void resumeRequested();
    void stopRequested();

public slots:
    void updateStatus(const smu::CaptureStatus& status);
    void showError(const QString& message);

private slots:
    void onRecordButtonClicked();
    void onPauseButtonClicked();

private:
    void setupUI();

    std::function<CaptureStatus()> statusSource_;
    CaptureStatus current_;

    QLabel* statusLabel_{nullptr};
    QLabel* timeLabel_{nullptr};
    QLabel* channelsLabel_{nullptr};
    QLabel* signalsLabel_{nullptr};
    QLabel* errorLabel_{nullptr};
    QPushButton* recordButton_{nullptr};
    QPushButton* pauseButton_{nullptr};
    QTimer pollTimer_;
};

} // namespace smu
