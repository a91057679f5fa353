#pragma once

#include <string>

namespace ito::util {

/*
  Random RFC 4122 version 4 UUID in canonical lowercase text form,
  e.g. "3f2b8c1e-9d4a-4e6f-b1c2-7a8d9e0f1a2b". Used for session ids.
*/
std::string GenerateUuidV4();

} // namespace ito::util
