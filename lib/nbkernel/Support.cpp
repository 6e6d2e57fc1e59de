#include "nbkernel/Support.h"

#include <chrono>

#include <llvm/Support/ConvertUTF.h>

using namespace nbkernel;

std::int64_t nbkernel::currentTimeMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

std::string nbkernel::sanitizeUTF8(llvm::StringRef Bytes) {
  std::string Result;
  Result.reserve(Bytes.size());
  auto Ptr = reinterpret_cast<const llvm::UTF8 *>(Bytes.data());
  auto End = Ptr + Bytes.size();
  while (Ptr < End) {
    unsigned Length = llvm::getNumBytesForUTF8(*Ptr);
    if (Ptr + Length <= End && llvm::isLegalUTF8Sequence(Ptr, Ptr + Length)) {
      Result.append(reinterpret_cast<const char *>(Ptr), Length);
      Ptr += Length;
    } else {
      Result += "\xef\xbf\xbd";
      Ptr += 1;
    }
  }
  return Result;
}

std::size_t nbkernel::utf8PrefixLength(llvm::StringRef Str,
                                       std::size_t MaxLength) {
  if (Str.size() <= MaxLength)
    return Str.size();
  std::size_t Length = MaxLength;
  // Back up over continuation bytes (10xxxxxx).
  while (Length > 0 &&
         (static_cast<unsigned char>(Str[Length]) & 0xc0) == 0x80)
    --Length;
  return Length ? Length : MaxLength;
}
