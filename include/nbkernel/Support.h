#ifndef NBKERNEL_SUPPORT_H
#define NBKERNEL_SUPPORT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include <llvm/ADT/StringRef.h>

namespace nbkernel {

// Allows static_assert to be used to mark a template instance as
// unimplemented.
template <class T> struct Unimplemented : std::false_type {};

// Helps create a callable type for use with std::visit.
// https://en.cppreference.com/w/cpp/utility/variant/visit
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

// Milliseconds since the Unix epoch, as used in execution records.
std::int64_t currentTimeMillis();

// Replace every invalid UTF-8 sequence in Bytes with U+FFFD, so the result
// can be stored in a text Node.
std::string sanitizeUTF8(llvm::StringRef Bytes);

// Return the length of the longest prefix of Str that does not end in the
// middle of a UTF-8 sequence, and is no longer than MaxLength.
std::size_t utf8PrefixLength(llvm::StringRef Str, std::size_t MaxLength);

} // end namespace nbkernel

#endif // NBKERNEL_SUPPORT_H
