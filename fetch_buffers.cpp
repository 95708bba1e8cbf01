#include "fetch_buffers.h"
#include "sluice_exceptions.h"

using namespace Sluice;

uint64_t FetchBufferManager::buffer_size_cap() const noexcept {
        return conf.max_buffer_size
                   ? std::min<uint64_t>(conf.max_buffer_size, Sluice_Limits::max_fetch_buffer_size)
                   : Sluice_Limits::max_fetch_buffer_size;
}

tl::optional<decoded_batch> FetchBufferManager::fetch(const fetch_plan_entry &e) {
        static constexpr bool trace{false};
        // enough to double from 1 byte past any cap, plus one out-of-range reset
        static constexpr uint32_t max_attempts{66};
        const auto &              tp           = e.tp;
        const uint64_t            default_size = conf.max_partition_fetch_bytes;
        const auto                cap          = buffer_size_cap();
        uint64_t                  size         = e.fetch_buffer_size ? e.fetch_buffer_size : default_size;
        uint64_t                  offset       = e.fetch_offset;
        bool                      grown{false};
        bool                      reset_done{false};

        // may grow the buffer; throws fetch_size_too_small if it can't grow past `required`
        const auto grow = [&](uint64_t required) {
                required = std::max(required, size + 1);

                if (size >= cap || required > cap) {
                        SLog(ansifmt::bold, ansifmt::color_red, "Next message of ", tp, " at ", offset, " requires ", size_repr(required),
                             ", max_buffer_size is ", size_repr(cap), ansifmt::reset, "\n");
                        throw fetch_size_too_small(tp, required, cap);
                }

                auto n = size;

                while (n < required) {
                        n *= 2;
                }

                n = std::min(n, cap);

                SLog("Growing fetch buffer of ", tp, " from ", size_repr(size), " to ", size_repr(n), "\n");
                size  = n;
                grown = true;
        };

        for (uint32_t attempt{0};; ++attempt) {
                if (cancel.requested()) {
                        if (trace) {
                                SLog("Cancelled fetch of ", tp, "\n");
                        }

                        return tl::nullopt;
                } else if (unlikely(attempt == max_attempts)) {
                        throw timeout_error("Gave up fetching ", tp, " at ", offset, " after ", attempt, " attempts");
                }

                if (trace) {
                        SLog("Fetching ", tp, " at ", offset, " max_bytes = ", size_repr(size), ", attempt ", attempt, "\n");
                }

                auto r = transport->fetch(tp, offset, static_cast<uint32_t>(size), conf.request_timeout_ms);

                switch (r.status) {
                        case fetch_response::Status::Data: {
                                auto cr = decoder.decode_chunk(r.chunk, offset, r.high_water_mark);

                                cursors.set_high_water_mark(tp, e.generation, r.high_water_mark);

                                if (!cr.msgs.empty()) {
                                        uint32_t fits_default_run{0};

                                        if (grown) {
                                                // keep the grown size for the next fetch
                                        } else if (size > default_size && cr.max_bundle_size <= default_size) {
                                                const auto partition = cursors.try_get(tp);

                                                fits_default_run = (partition ? partition->fits_default_run : 0) + 1;

                                                if (conf.buffer_shrink_after && fits_default_run >= conf.buffer_shrink_after) {
                                                        if (trace) {
                                                                SLog("Shrinking fetch buffer of ", tp, " to ", size_repr(default_size), "\n");
                                                        }

                                                        size             = default_size;
                                                        fits_default_run = 0;
                                                }
                                        }

                                        cursors.set_fetch_buffer_size(tp, e.generation, size, fits_default_run);

                                        return decoded_batch{
                                            .tp              = tp,
                                            .generation      = e.generation,
                                            .msgs            = std::move(cr.msgs),
                                            .high_water_mark = r.high_water_mark,
                                            .chunk_size      = r.chunk.size(),
                                        };
                                } else if (cr.need_bytes) {
                                        // the chunk holds a partial first bundle
                                        grow(cr.need_bytes);
                                        continue;
                                }

                                // nothing past offset
                                return tl::nullopt;
                        }

                        case fetch_response::Status::Empty:
                                cursors.set_high_water_mark(tp, e.generation, r.high_water_mark);
                                return tl::nullopt;

                        case fetch_response::Status::SizeTooSmall:
                                grow(r.required_size);
                                continue;

                        case fetch_response::Status::OutOfRange: {
                                if (!may_reset_on_out_of_range()) {
                                        throw offset_out_of_range(tp, offset, r.first_available, r.high_water_mark);
                                } else if (reset_done) {
                                        SLog(ansifmt::bold, ansifmt::color_red, "Offset ", offset, " of ", tp, " still out of range [",
                                             r.first_available, ", ", r.high_water_mark, ") after reset", ansifmt::reset, "\n");

                                        cursors.mark_failed(tp, e.generation);
                                        throw offset_out_of_range(tp, offset, r.first_available, r.high_water_mark);
                                }

                                const auto reset_to = resolver.boundary(tp, conf.auto_offset_reset);

                                SLog("Offset ", offset, " of ", tp, " out of range [", r.first_available, ", ", r.high_water_mark,
                                     "), resetting to ", conf.auto_offset_reset, " ", reset_to, "\n");

                                if (!cursors.reset_position(tp, e.generation, reset_to)) {
                                        // repositioned or revoked meanwhile
                                        return tl::nullopt;
                                }

                                offset     = reset_to;
                                reset_done = true;
                                continue;
                        }

                        case fetch_response::Status::UnknownPartition:
                                throw timeout_error("Partition ", tp, " is not known to the broker");
                }
        }
}
