// DAOSTAKE - Serialization Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/core/serialize.h"
#include "daostake/core/hex.h"

#include <iterator>

namespace daostake {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

void SerializeAmount(DataStream& s, const Amount& amount) {
    std::vector<uint8_t> bytes;
    boost::multiprecision::export_bits(amount, std::back_inserter(bytes), 8);

    // export_bits emits the minimal big-endian representation
    std::vector<uint8_t> word(AMOUNT_BYTES - bytes.size(), 0);
    word.insert(word.end(), bytes.begin(), bytes.end());
    s.Write(word.data(), word.size());
}

Amount UnserializeAmount(DataStream& s) {
    uint8_t word[AMOUNT_BYTES];
    s.Read(word, AMOUNT_BYTES);

    Amount result;
    boost::multiprecision::import_bits(result, word, word + AMOUNT_BYTES, 8);
    return result;
}

} // namespace daostake
