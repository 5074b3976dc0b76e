#pragma once
// RecordingStore.hpp - Persists completed sessions to disk
// One directory per session: media files plus recording.json

#include <QByteArray>
#include "Dispatcher.hpp"
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace smu {

class RecordingStore {
public:
    explicit RecordingStore(fs::path directory);

    // Returns the session directory that was written
    Result<fs::path> save(const CompletedRecording& recording);

    const fs::path& directory() const {
        return directory_;
    }

    static QByteArray manifest(const CompletedRecording& recording);
    static std::string fileNameFor(const RecordingArtifact& artifact);

private:
    fs::path uniqueSessionDir(const CompletedRecording& recording) const;

    fs::path directory_;
};

} // namespace smu
