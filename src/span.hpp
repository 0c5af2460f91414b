#pragma once

#include <cstdint>

#include "source.hpp"

namespace protodesc {

struct SourceLoc {
    std::uint32_t line = 1;
    std::uint32_t column = 1;
};

struct Span {
    FileId file = kNoFile;
    SourceLoc begin{};
    SourceLoc end{};

    bool has_file() const { return file != kNoFile; }
};

}  // namespace protodesc
