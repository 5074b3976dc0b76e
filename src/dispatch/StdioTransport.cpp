#include "StdioTransport.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include "ControlMessages.hpp"
#include "core/Logger.hpp"

namespace smu {

namespace {
constexpr qsizetype kMaxLineBytes = 16 * 1024 * 1024;
}

StdioTransport::StdioTransport(int inputFd, int outputFd, QObject* parent)
    : QObject(parent), inputFd_(inputFd) {
    if (!output_.open(outputFd, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        LOG_ERROR("Cannot open output descriptor {}: {}",
                  outputFd,
                  output_.errorString().toStdString());
    }

    notifier_ = std::make_unique<QSocketNotifier>(inputFd_,
                                                  QSocketNotifier::Read);
    connect(notifier_.get(),
            &QSocketNotifier::activated,
            this,
            &StdioTransport::onReadable);
}

StdioTransport::~StdioTransport() {
    if (notifier_)
        notifier_->setEnabled(false);
    output_.close();
}

void StdioTransport::send(const QJsonObject& message) {
    if (!output_.isOpen())
        return;
    QByteArray line = ControlMessages::toLine(message);
    if (output_.write(line) != line.size()) {
        LOG_WARN("Short write on output: {}", output_.errorString().toStdString());
    }
    output_.flush();
}

void StdioTransport::onReadable() {
    char buf[4096];
    ssize_t n = ::read(inputFd_, buf, sizeof(buf));
    if (n > 0) {
        pending_.append(buf, static_cast<qsizetype>(n));
        drainLines();
        if (pending_.size() > kMaxLineBytes) {
            LOG_WARN("Discarding {} bytes without a line break", pending_.size());
            pending_.clear();
        }
        return;
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR))
        return;

    if (n < 0)
        LOG_ERROR("Input read failed: {}", std::strerror(errno));
    else
        LOG_INFO("Input closed");

    // A final line without a trailing newline still counts
    if (!pending_.trimmed().isEmpty()) {
        QByteArray last = std::move(pending_);
        pending_.clear();
        lineReceived.emitSignal(last);
    }
    close();
}

void StdioTransport::drainLines() {
    qsizetype newline;
    while ((newline = pending_.indexOf('\n')) >= 0) {
        QByteArray line = pending_.left(newline);
        pending_.remove(0, newline + 1);
        if (line.endsWith('\r'))
            line.chop(1);
        if (!line.isEmpty())
            lineReceived.emitSignal(line);
    }
}

void StdioTransport::close() {
    if (!open_)
        return;
    open_ = false;
    notifier_->setEnabled(false);
    closed.emitSignal();
}

} // namespace smu
