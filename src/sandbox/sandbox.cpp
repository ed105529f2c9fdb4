#include "sandbox/sandbox.hpp"

namespace codejudge {

sandbox::~sandbox() = default;

}  // namespace codejudge
