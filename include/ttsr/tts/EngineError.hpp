/**
 * EngineError.hpp - Failure of a platform text-to-speech call
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ttsr::tts {

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ttsr::tts
