//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "utils/counter/byte_counter.hpp"

namespace gallerydrop {
void ByteCountingCallback::operator()(byte_count_t bytes_sent, byte_count_t /*total_bytes*/) {
  if (bytes_sent <= last_bytes_) {
    return;
  }
  const byte_count_t delta = bytes_sent - last_bytes_;
  last_bytes_              = bytes_sent;
  if (global_counter_) {
    global_counter_->Add(delta);
  }
  if (gallery_counter_) {
    gallery_counter_->Add(delta);
  }
}
}  // namespace gallerydrop
