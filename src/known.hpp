#pragma once

#include <cstddef>

#include "Library.hpp"

// "The Ultimate Puzzle" (YMIR, Inc.): 16 pieces on a 4x4 board
extern const char * const known_pieces[];
extern const size_t known_pieces_count;
constexpr inline size_t known_rows = 4, known_cols = 4;

Library known_library();
