#ifndef SPIROB_CHAIN_MJCF_WRITER_HPP
#define SPIROB_CHAIN_MJCF_WRITER_HPP

#include "chain_exporter.hpp"
#include <string>

namespace spirob {

// Serialize a chain as a MuJoCo model document (returns string content)
std::string to_mjcf(const ChainDescription& chain);

// Write the document to `path`; throws std::runtime_error on failure
void write_mjcf(const ChainDescription& chain, const std::string& path);

}  // namespace spirob

#endif // SPIROB_CHAIN_MJCF_WRITER_HPP
