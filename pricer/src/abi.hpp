#pragma once

#include <string>
#include <vector>

// Minimal Solidity ABI helpers for the read-only calls this service makes.
namespace abi {

// 4-byte selectors, keccak256 of the signature
inline constexpr const char* kGetPool = "0x79bc57d5";      // getPool(address,address,bool)
inline constexpr const char* kToken0 = "0x0dfe1681";       // token0()
inline constexpr const char* kToken1 = "0xd21220a7";       // token1()
inline constexpr const char* kGetReserves = "0x0902f1ac";  // getReserves()
inline constexpr const char* kDecimals = "0x313ce567";     // decimals()

// 32-byte argument words, 64 hex chars without prefix
std::string encode_address(const std::string& address);
std::string encode_bool(bool value);

std::string encode_call(const std::string& selector, const std::vector<std::string>& words);

// Result decoding. `result` is the 0x-prefixed eth_call return data.
// Throws std::runtime_error when the result is shorter than the requested word.
size_t word_count(const std::string& result);
std::string word(const std::string& result, size_t index);
std::string decode_address(const std::string& result, size_t index = 0);
std::string decode_uint(const std::string& result, size_t index = 0);

} // namespace abi
