/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_CODER_KV_CODER_HPP
#define DATAFLOW_CODER_KV_CODER_HPP
#include <memory>
#include <string>
#include <utility>
#include <logger/logger.hpp>
#include <exceptions/error_types.hpp>
#include <coder/coder.hpp>
#include <coder/basic_coders.hpp>

namespace dataflow {

/**
 * Key/value pairs, composed from a key coder and a value coder.
 * The encoding is varint(length of encoded key), the encoded key, then the
 * encoded value running to the end of the byte string.
 */
template <typename K, typename V>
class kv_coder : public coder<std::pair<K, V> > {
 public:
  kv_coder(std::shared_ptr<const coder<K> > key_coder,
           std::shared_ptr<const coder<V> > value_coder)
      : m_key_coder(key_coder), m_value_coder(value_coder) {
    if (!m_key_coder || !m_value_coder) {
      std_log_and_throw(invalid_argument, "kv_coder requires two coders");
    }
  }

  std::string encode(const std::pair<K, V>& value) const {
    std::string key = m_key_coder->encode(value.first);
    std::string out;
    append_varint(out, key.size());
    out.append(key);
    out.append(m_value_coder->encode(value.second));
    return out;
  }

  std::pair<K, V> decode(const std::string& bytes) const {
    uint64_t keylen;
    size_t pos = read_varint(bytes, 0, keylen);
    if (keylen > bytes.size() - pos) {
      std_log_and_throw(decode_error,
                        "Key length " << keylen << " exceeds the "
                        << (bytes.size() - pos) << " remaining bytes");
    }
    K key = m_key_coder->decode(bytes.substr(pos, keylen));
    V value = m_value_coder->decode(bytes.substr(pos + keylen));
    return std::make_pair(key, value);
  }

 private:
  std::shared_ptr<const coder<K> > m_key_coder;
  std::shared_ptr<const coder<V> > m_value_coder;
};

} // namespace dataflow
#endif
