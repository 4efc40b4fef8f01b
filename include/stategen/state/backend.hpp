#pragma once
#include <stategen/schema/encoding/scale/encoder.hpp>
#include <stategen/storage/rocksdb/storage.hpp>

namespace stategen::state {

using encoder_t = stategen::schema::encoding::encoder<
    stategen::schema::encoding::scale_encoder_tag>;
using storage_t =
    stategen::storage::storage<stategen::storage::rocksdb_storage_tag>;

}  // namespace stategen::state
