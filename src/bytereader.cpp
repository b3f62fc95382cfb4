/**
 * @file bytereader.cpp
 * @brief ByteReader compilation unit.
 *
 * ByteReader is implemented entirely in bytereader.hpp so that its
 * accessors inline into the DUID decoder. This unit compiles the header
 * in isolation as part of the static library.
 *
 * @see include/duidkit/bytereader.hpp for the full implementation
 */

#include <duidkit/bytereader.hpp>

// All implementation is in the header (inline functions)
