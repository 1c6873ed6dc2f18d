#pragma once
#include <stdexcept>
#include <string>

namespace sigvad {

enum class ErrorKind {
    InvalidInput,          // empty or malformed signal/spectrogram
    InvalidConfiguration,  // bad frame/hop lengths, negative top_db, ...
    StreamClosed           // push/flush after the stream was flushed
};

const char* to_string(ErrorKind kind);

class DetectorError : public std::runtime_error {
public:
    DetectorError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message),
          kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace sigvad
