/***
 * Name: labelkit::support::ReadFile
 * Purpose: Load a label script from disk.
 * Inputs:
 *   - path: script path
 * Outputs:
 *   - out: script text on success
 *   - err: error message on failure
 * Theory of Operation: Opens the file and hands it to ReadStream, so files
 *   and stdin share one read path.
 */
#include "labelkit/support/fs.h"

#include <fstream>
#include <string>
#include <utility>

namespace labelkit::support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  std::string text;
  if (!file.is_open() || !ReadStream(file, text, err)) {
    err = "cannot read label script '" + path + "'";
    return false;
  }
  out = std::move(text);
  return true;
}

}  // namespace labelkit::support
