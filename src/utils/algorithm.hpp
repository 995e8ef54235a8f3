// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <string>

namespace chronobolt::utils {

/**
 * Outputs a collection of items to the given stream, separating them with the
 * given delimiter.
 *
 * @param stream Destination stream.
 * @param first Starting iterator of collection which items are going to be
 *  printed.
 * @param last Ending iterator of the collection.
 * @param delim Delimiter that is put between items.
 * @param streamer Function which accepts a TStream and an item and streams the
 *  item to the stream.
 */
template <typename TStream, typename TIterator, typename TStreamer>
inline void PrintIterable(TStream *stream, TIterator first, TIterator last, const std::string &delim = ", ",
                          TStreamer streamer = {}) {
  if (first != last) {
    streamer(*stream, *first);
    ++first;
  }
  for (; first != last; ++first) {
    *stream << delim;
    streamer(*stream, *first);
  }
}

template <typename TStream, typename TIterable, typename TStreamer>
inline void PrintIterable(TStream &stream, const TIterable &iterable, const std::string &delim = ", ",
                          TStreamer streamer = {}) {
  PrintIterable(&stream, iterable.begin(), iterable.end(), delim, streamer);
}

template <typename TStream, typename TIterable>
inline void PrintIterable(TStream &stream, const TIterable &iterable, const std::string &delim = ", ") {
  PrintIterable(stream, iterable, delim, [](auto &stream, const auto &item) { stream << item; });
}

}  // namespace chronobolt::utils
