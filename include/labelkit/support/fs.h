/***
 * Name: labelkit::support (fs)
 * Purpose: Minimal input helpers for reading label scripts.
 * Inputs: Paths or streams
 * Outputs: Text contents
 * Theory of Operation: Thin wrappers over iostreams to centralize error handling.
 */
#pragma once

#include <iosfwd>
#include <string>

namespace labelkit {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** ReadStream: Read the remainder of `in` into out. Return true on success. */
bool ReadStream(std::istream& in, std::string& out, std::string& err);

}  // namespace support
}  // namespace labelkit
