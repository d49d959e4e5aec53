#ifndef MCPDISPATCH_UUID_HPP
#define MCPDISPATCH_UUID_HPP

#include <string>

namespace uuid {

// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase hex form.
// Safe to call from several threads.
std::string generate();

} // namespace uuid

#endif // MCPDISPATCH_UUID_HPP
