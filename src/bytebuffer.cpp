/**
 * @file bytebuffer.cpp
 * @brief ByteBuffer compilation unit.
 *
 * ByteBuffer is a class template sized by its capacity, so it lives in
 * bytebuffer.hpp. This unit compiles the header in isolation and
 * instantiates the DUID-sized buffer once for the library.
 *
 * @see include/duidkit/bytebuffer.hpp for the full implementation
 */

#include <duidkit/bytebuffer.hpp>

namespace duidkit {

template class ByteBuffer<MAX_DUID_BYTES>;

} // namespace duidkit
