#pragma once

#include <nlohmann/json.hpp>

namespace bdsm::image {

// The part of an Image that crosses process boundaries when work is
// distributed over worker processes. Maps and options are re-established
// by the receiver.
struct HandoffState {
    double thresh_pix = 0.0;
    int minpix_isl = 0;
    double clipped_mean = 0.0;
};

inline void to_json(nlohmann::json& j, const HandoffState& s) {
    j = nlohmann::json{
        {"thresh_pix", s.thresh_pix},
        {"minpix_isl", s.minpix_isl},
        {"clipped_mean", s.clipped_mean}
    };
}

inline void from_json(const nlohmann::json& j, HandoffState& s) {
    j.at("thresh_pix").get_to(s.thresh_pix);
    j.at("minpix_isl").get_to(s.minpix_isl);
    j.at("clipped_mean").get_to(s.clipped_mean);
}

} // namespace bdsm::image
