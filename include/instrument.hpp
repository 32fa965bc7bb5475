#pragma once

#include "types.hpp"
#include <string>
#include <cstdint>

namespace LobReplay {

/**
 * Instrument identifier and book configuration.
 *
 * The range of interest (ROI) bounds the prices a book tracks:
 * [roi_center - roi_width / 2, roi_center + roi_width / 2].
 * A zero roi_width means the book is unbounded.
 */
struct Instrument {
    std::string symbol;
    Price tick_size;       // Minimum price increment
    Quantity lot_size;     // Minimum quantity increment
    Price roi_center;
    Price roi_width;

    explicit Instrument(const std::string& sym, Price tick = 1, Quantity lot = 1,
                        Price center = 0, Price width = 0)
        : symbol(sym), tick_size(tick), lot_size(lot),
          roi_center(center), roi_width(width) {}

    bool has_roi() const noexcept {
        return roi_width > 0;
    }

    Price roi_lower_bound() const noexcept {
        return roi_center - roi_width / 2;
    }

    Price roi_upper_bound() const noexcept {
        return roi_center + roi_width / 2;
    }

    bool in_roi(Price price) const noexcept {
        return !has_roi() || (price >= roi_lower_bound() && price <= roi_upper_bound());
    }

    bool is_valid_price(Price price) const noexcept {
        return tick_size <= 0 || (price % tick_size) == 0;
    }

    bool is_valid_quantity(Quantity quantity) const noexcept {
        return lot_size == 0 || (quantity % lot_size) == 0;
    }
};

} // namespace LobReplay
