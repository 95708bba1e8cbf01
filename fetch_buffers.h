#pragma once
#include "cursors.h"
#include "msg_decoder.h"
#include "offsets_resolver.h"

namespace Sluice {
        // Issues one fetch for a partition and sizes its fetch buffer.
        //
        // The buffer starts at max_partition_fetch_bytes and doubles whenever the next message doesn't fit,
        // up to max_buffer_size (or Sluice_Limits::max_fetch_buffer_size when that's disabled).
        // A grown buffer shrinks back after buffer_shrink_after consecutive fetches whose bundles
        // all fit in the default size.
        class FetchBufferManager final {
              private:
                BrokerTransport *const    transport;
                PartitionCursors &        cursors;
                MessageDecoder &          decoder;
                OffsetsResolver &         resolver;
                const consumer_conf &     conf;
                const cancellation_token &cancel;

                uint64_t buffer_size_cap() const noexcept;

                bool may_reset_on_out_of_range() const noexcept {
                        return conf.reset_offset_on_out_of_range && conf.auto_offset_reset != offset_reset_policy::Fail;
                }

              public:
                FetchBufferManager(BrokerTransport *const t, PartitionCursors &c, MessageDecoder &d, OffsetsResolver &r,
                                   const consumer_conf &cf, const cancellation_token &ct)
                    : transport{t}
                    , cursors{c}
                    , decoder{d}
                    , resolver{r}
                    , conf{cf}
                    , cancel{ct} {
                }

                // nullopt if there is nothing to consume now, if the fetch was cancelled, or if the
                // cursor was repositioned while the fetch was in flight
                //
                // throws fetch_size_too_small, offset_out_of_range, unsupported_codec, corrupt_message and timeout_error;
                // the cursor's position is never advanced here
                tl::optional<decoded_batch> fetch(const fetch_plan_entry &e);
        };
} // namespace Sluice
