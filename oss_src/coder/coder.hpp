/**
 * Copyright (C) 2016 Turi
 * All rights reserved.
 *
 * This software may be modified and distributed under the terms
 * of the BSD license. See the LICENSE file for details.
 */
#ifndef DATAFLOW_CODER_CODER_HPP
#define DATAFLOW_CODER_CODER_HPP
#include <string>

namespace dataflow {

/**
 * \ingroup coder
 * The interface between typed elements and the opaque byte strings records
 * are stored as.
 *
 * A coder is stateless once constructed: encode() and decode() are const
 * and may be called concurrently from any number of threads, so one coder
 * instance can be shared by every iterator reading a source.
 *
 * decode() throws dataflow::decode_error if the bytes are not a valid
 * encoding of a T.
 */
template <typename T>
class coder {
 public:
  typedef T value_type;

  virtual ~coder() { }

  /// Encodes a value into its byte representation.
  virtual std::string encode(const T& value) const = 0;

  /// Decodes a value from its byte representation.
  virtual T decode(const std::string& bytes) const = 0;
};

} // namespace dataflow
#endif
