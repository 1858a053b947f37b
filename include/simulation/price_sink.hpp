#pragma once

#include <functional>
#include <string>
#include <utility>
#include "common/types.hpp"

namespace pmsim {

using PriceCallback = std::function<void(const PricePoint&)>;

/**
 * Receiver of published price points. Implementations get a copy of each
 * point, in sequence order, on the producing thread.
 */
class PriceSink {
public:
    virtual ~PriceSink() = default;

    virtual void on_price(const PricePoint& point) = 0;
    virtual std::string name() const = 0;
};

/**
 * Adapts a plain callback to the sink interface.
 */
class CallbackSink : public PriceSink {
public:
    explicit CallbackSink(PriceCallback callback, std::string name = "callback")
        : callback_(std::move(callback))
        , name_(std::move(name))
    {
    }

    void on_price(const PricePoint& point) override {
        if (callback_) callback_(point);
    }

    std::string name() const override { return name_; }

private:
    PriceCallback callback_;
    std::string name_;
};

} // namespace pmsim
