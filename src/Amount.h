#pragma once

#include <array>
#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

// 18자리 고정소수점 금액. 오버플로와 음수 결과는 예외로 끊는다.
using Amount = boost::multiprecision::checked_uint256_t;

// 난수 워드와 해시 값은 모듈러 연산만 하므로 unchecked 타입을 쓴다.
using Word256 = boost::multiprecision::uint256_t;

using Bytes32 = std::array<std::uint8_t, 32>;

constexpr unsigned kTokenDecimals = 18;
constexpr unsigned kPriceFeedDecimals = 8;

Amount pow10(unsigned exponent);
const Amount& tokenUnit();

// "12" 또는 "0.5" 같은 십진 문자열을 10^decimals 스케일 정수로 바꾼다.
Amount parseUnits(const std::string& text, unsigned decimals);
Amount parseBaseUnits(const std::string& text);
std::string formatUnits(const Amount& value, unsigned decimals);

Bytes32 toBigEndian(const Word256& value);
Bytes32 toBigEndian(std::uint64_t value);
Word256 fromBigEndian(const Bytes32& bytes);
std::string toHex(const Bytes32& bytes);
