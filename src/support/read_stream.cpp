/***
 * Name: labelkit::support::ReadStream
 * Purpose: Read everything left in an input stream (used for stdin scripts).
 * Inputs:
 *   - in: source stream
 * Outputs:
 *   - out: stream contents on success
 *   - err: error message on failure
 * Theory of Operation: Copies the stream buffer; a stream already in a failed
 *   state is reported as an error.
 */
#include "labelkit/support/fs.h"

#include <istream>
#include <sstream>
#include <string>

namespace labelkit::support {

bool ReadStream(std::istream& in, std::string& out, std::string& err) {
  if (!in.good()) {
    err = "failed to read input stream";
    return false;
  }
  std::ostringstream stream;
  stream << in.rdbuf();
  out = stream.str();
  return true;
}

}  // namespace labelkit::support
