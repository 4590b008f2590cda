// Copyright 2026 The rlpkit Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <rlpkit/core/common/bytes.hpp>
#include <rlpkit/core/common/decoding_result.hpp>
#include <rlpkit/core/common/encoding_result.hpp>
#include <rlpkit/core/rlp/decode_vector.hpp>
#include <rlpkit/core/rlp/encode_vector.hpp>
#include <rlpkit/core/rlp/value.hpp>

namespace rlpkit::rlp {

//! Encodes and decodes one field of a record
class FieldCodec {
  public:
    virtual ~FieldCodec() = default;

    virtual EncodingResult encode(Bytes& to) const = 0;

    //! \brief Decodes into a pending value, leaving the field itself untouched
    //! \param from : exactly one RLP item
    virtual DecodingResult decode(ByteView& from) = 0;

    //! Stores the pending value of the last successful decode() into the field
    virtual void commit() = 0;
};

class Record;

namespace detail {

    template <typename T>
    void encode_bound(Bytes& to, const T& value) {
        encode(to, value);
    }

    template <typename T>
    DecodingResult decode_bound(ByteView& from, T& value) noexcept {
        return decode(from, value, Leftover::kProhibit);
    }

}  // namespace detail

//! FieldCodec bound to a variable of type T, dispatching to the rlp::encode/decode overloads for T
template <typename T>
class FieldBinding : public FieldCodec {
  public:
    explicit FieldBinding(T& value) : value_{value} {}

    EncodingResult encode(Bytes& to) const override {
        if constexpr (std::same_as<T, Record>) {
            return value_.encode(to);
        } else if constexpr (std::signed_integral<T> && !std::same_as<T, char>) {
            return encode_signed(to, value_);
        } else {
            detail::encode_bound(to, value_);
            return {};
        }
    }

    DecodingResult decode(ByteView& from) override {
        if constexpr (std::same_as<T, Record>) {
            return value_.stage(from, Leftover::kProhibit, nullptr);
        } else if constexpr (std::signed_integral<T> && !std::same_as<T, char>) {
            return decode_signed(from, pending_);
        } else {
            return detail::decode_bound(from, pending_);
        }
    }

    void commit() override {
        if constexpr (std::same_as<T, Record>) {
            value_.commit();
        } else {
            value_ = std::move(pending_);
        }
    }

  private:
    T& value_;
    // nested records stage inside their own bindings
    std::conditional_t<std::same_as<T, Record>, std::monostate, T> pending_{};
};

/**
 * A list with a fixed number of fields of possibly different types, declared at runtime:
 * \code
 *   rlp::Record record;
 *   record.field(account.nonce).field(account.balance).field(account.code);
 *   record.encode(out);
 * \endcode
 * Fields are bound by reference and must outlive the record, nested records included.
 */
class Record {
  public:
    Record() = default;

    Record(Record&&) = default;
    Record& operator=(Record&&) = default;

    template <typename T>
    Record& field(T& value) {
        static_assert(!std::is_const_v<T>, "record fields must be decodable");
        fields_.push_back(std::make_unique<FieldBinding<T>>(value));
        return *this;
    }

    //! Registers a custom codec for the next field
    Record& field(std::unique_ptr<FieldCodec> codec) {
        fields_.push_back(std::move(codec));
        return *this;
    }

    size_t arity() const noexcept { return fields_.size(); }

    //! Fails only if a field holds a value with no RLP representation
    EncodingResult encode(Bytes& to) const;

    //! \brief Decodes the fields in declaration order
    //! \param [out] decoded_arity : if not null, receives the number of items found in the list
    //! \return kUnexpectedListElements if the list doesn't have exactly arity() items
    //! \remarks Fields are assigned only once all of them decoded successfully; on failure none is changed
    DecodingResult decode(ByteView& from, Leftover mode = Leftover::kProhibit, size_t* decoded_arity = nullptr);

  private:
    template <typename T>
    friend class FieldBinding;

    DecodingResult stage(ByteView& from, Leftover mode, size_t* decoded_arity);
    void commit();

    std::vector<std::unique_ptr<FieldCodec>> fields_;
};

}  // namespace rlpkit::rlp
