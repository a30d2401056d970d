#pragma once

/**
 * @file map.hpp
 * @brief Record transformation processors
 */

#include <functional>
#include <type_traits>

#include "streamiq/core/processor.hpp"

namespace streamiq {

/**
 * @brief Transforms each record and forwards the result
 *
 * The function may take the value payload (key and metadata are kept)
 * or the whole record.
 */
template<typename MapFunc>
class MapProcessor : public Processor {
public:
    MapProcessor(std::string name, MapFunc func)
        : Processor(std::move(name))
        , func_(std::move(func)) {}

    void process(Record& record, ProcessorContext& ctx) override {
        record_received();
        auto timer = time_processing();

        if constexpr (std::is_invocable_r_v<Record, MapFunc, const Record&>) {
            ctx.forward(func_(static_cast<const Record&>(record)));
        } else {
            static_assert(std::is_invocable_r_v<Payload, MapFunc, const Payload&>,
                "map function must take a Record or a Payload");
            ctx.forward(Record{record.key(), func_(record.value()), record.metadata()});
        }
        record_forwarded();
    }

private:
    MapFunc func_;
};

template<typename MapFunc>
auto make_map(std::string name, MapFunc&& func) {
    return std::make_unique<MapProcessor<std::decay_t<MapFunc>>>(
        std::move(name), std::forward<MapFunc>(func)
    );
}

/**
 * @brief Re-key records with a function of the record
 */
inline auto make_key_selector(std::string name, std::function<Payload(const Record&)> selector) {
    return make_map(std::move(name), [f = std::move(selector)](const Record& record) -> Record {
        return Record{f(record), record.value(), record.metadata()};
    });
}

} // namespace streamiq
