#include "adapters/secondary/system/SecureRandomSource.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace arena::adapters::secondary {

double SecureRandomSource::nextUnit() {
    uint64_t bits = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&bits), sizeof(bits)) != 1) {
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    return static_cast<double>(bits >> 11) * 0x1.0p-53;
}

} // namespace arena::adapters::secondary
