// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#include "record.hpp"

namespace rlpkit::rlp {

EncodingResult Record::encode(Bytes& to) const {
    Bytes payload;
    for (const auto& field : fields_) {
        if (EncodingResult res{field->encode(payload)}; !res) {
            return res;
        }
    }
    encode_header(to, {.list = true, .payload_length = payload.size()});
    to.append(payload);
    return {};
}

DecodingResult Record::stage(ByteView& from, Leftover mode, size_t* decoded_arity) {
    std::vector<RlpByteView> items;
    if (DecodingResult res{rlp::decode(from, items, mode)}; !res) {
        return res;
    }
    if (decoded_arity) {
        *decoded_arity = items.size();
    }
    if (items.size() != fields_.size()) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }

    for (size_t i{0}; i < items.size(); ++i) {
        ByteView item{items[i].data};
        if (DecodingResult res{fields_[i]->decode(item)}; !res) {
            return res;
        }
    }
    return {};
}

void Record::commit() {
    for (const auto& field : fields_) {
        field->commit();
    }
}

DecodingResult Record::decode(ByteView& from, Leftover mode, size_t* decoded_arity) {
    if (DecodingResult res{stage(from, mode, decoded_arity)}; !res) {
        return res;
    }
    commit();
    return {};
}

}  // namespace rlpkit::rlp
