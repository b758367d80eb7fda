/**
 * @file pilot_point.cpp
 * @brief PilotPoint construction
 */

#include "t2p/control/pilot_point.hpp"
#include "t2p/io/format.hpp"
#include <fstream>
#include <stdexcept>

namespace t2p {

PilotPoint::PilotPoint(const Vec2& location, const HydraulicValues& hydraulic,
                       std::optional<StorageValues> storage, Index zone)
    : location_(location), zone_(zone), hydraulic_(hydraulic), storage_(storage) {
    const auto& f = formats::PP_FLOAT;
    params_.add({"KCMin", hydraulic_.KCMin, f});
    params_.add({"deltaKC", hydraulic_.deltaKC, f});
    params_.add({"KFMin", hydraulic_.KFMin, f});
    params_.add({"deltaKF", hydraulic_.deltaKF, f});
    if (storage_) {
        const auto& s = formats::PP_SCI;
        params_.add({"SsC", storage_->SsC, s});
        params_.add({"SsF", storage_->SsF, s});
        params_.add({"SyC", storage_->SyC, s});
        params_.add({"SyF", storage_->SyF, s});
    }
    params_.add({"AnisoC", hydraulic_.AnisoC, f});
    params_.add({"AnisoF", hydraulic_.AnisoF, f});
}

PilotPoint PilotPoint::aquifer(const Vec2& location, const HydraulicValues& hydraulic,
                               const StorageValues& storage, Index zone) {
    return PilotPoint(location, hydraulic, storage, zone);
}

PilotPoint PilotPoint::aquitard(const Vec2& location, const HydraulicValues& hydraulic,
                                Index zone) {
    return PilotPoint(location, hydraulic, std::nullopt, zone);
}

std::vector<std::string> PilotPoint::parameter_names(PilotPointKind kind) {
    if (kind == PilotPointKind::Aquifer) {
        return {"KCMin", "deltaKC", "KFMin", "deltaKF", "SsC", "SsF", "SyC", "SyF",
                "AnisoC", "AnisoF"};
    }
    return {"KCMin", "deltaKC", "KFMin", "deltaKF", "AnisoC", "AnisoF"};
}

std::vector<PilotPoint> read_pilot_points(const std::filesystem::path& filepath,
                                          PilotPointKind kind) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open pilot point file: " + filepath.string());
    }

    const bool aquifer = kind == PilotPointKind::Aquifer;
    const size_t n_fields = aquifer ? 13 : 9;

    std::vector<PilotPoint> points;
    std::string line;
    std::getline(file, line);  // Header

    Index line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        const auto fields = text::split_whitespace(line);
        if (fields.empty()) continue;
        const std::string where = filepath.string() + ":" + std::to_string(line_no);
        if (fields.size() < n_fields) {
            throw std::runtime_error(where + ": expected " + std::to_string(n_fields) +
                                     " fields, found " + std::to_string(fields.size()));
        }

        std::vector<Real> v;
        try {
            for (size_t i = 0; i + 1 < n_fields; ++i) {
                v.push_back(text::to_real(fields[i]));
            }
            const Index zone = text::to_index(fields[n_fields - 1]);

            const Vec2 location(v[0], v[1]);
            HydraulicValues k{v[2], v[3], v[4], v[5], 10.0, 10.0};
            if (aquifer) {
                k.AnisoC = v[10];
                k.AnisoF = v[11];
                points.push_back(PilotPoint::aquifer(location, k, {v[6], v[7], v[8], v[9]}, zone));
            } else {
                k.AnisoC = v[6];
                k.AnisoF = v[7];
                points.push_back(PilotPoint::aquitard(location, k, zone));
            }
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(where + ": " + e.what());
        }
    }
    return points;
}

} // namespace t2p
