#pragma once

/**
 * @file filter.hpp
 * @brief Filter processor
 */

#include <type_traits>

#include "streamiq/core/processor.hpp"

namespace streamiq {

/**
 * @brief Forwards records matching a predicate, drops the rest
 */
template<typename Predicate>
class FilterProcessor : public Processor {
public:
    FilterProcessor(std::string name, Predicate pred)
        : Processor(std::move(name))
        , predicate_(std::move(pred)) {}

    void process(Record& record, ProcessorContext& ctx) override {
        record_received();
        auto timer = time_processing();

        bool pass = false;
        if constexpr (std::is_invocable_r_v<bool, Predicate, const Record&>) {
            pass = predicate_(static_cast<const Record&>(record));
        } else {
            pass = predicate_(record.value());
        }

        if (pass) {
            ctx.forward(record);
            record_forwarded();
        } else {
            record_dropped();
        }
    }

private:
    Predicate predicate_;
};

template<typename Predicate>
auto make_filter(std::string name, Predicate&& pred) {
    return std::make_unique<FilterProcessor<std::decay_t<Predicate>>>(
        std::move(name), std::forward<Predicate>(pred)
    );
}

} // namespace streamiq
