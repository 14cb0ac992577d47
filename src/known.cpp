#include "known.hpp"

#include <iterator>

const char * const known_pieces[] = {
    "EAGB", "CABD", "GCHB", "GEFD",
    "EADF", "CAHD", "CEFD", "CEBD",
    "CGDB", "CCFD", "AGHF", "GGBD",
    "GGBF", "EEDH", "GCFH", "ACFF",
};

const size_t known_pieces_count = std::size(known_pieces);

Library known_library() {
    Library lib;
    for (auto i = 0zu; i < known_pieces_count; i++)
        lib.push(known_pieces[i]);
    return lib;
}
