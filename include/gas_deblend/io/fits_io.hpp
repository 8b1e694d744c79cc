#pragma once

#include "gas_deblend/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gas_deblend::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);

    bool contains(const std::string& key) const;
};

bool is_fits_image_path(const fs::path& path);

// Coordinate cards (CTYPE/CRVAL/CRPIX/CDELT/CUNIT/CROTA for axes 1..naxis,
// CD/PC matrices, RADESYS, EQUINOX, SPECSYS, RESTFRQ, OBJECT) of `header`.
FitsHeader coordinate_cards(const FitsHeader& header, int naxis);

// Moves coordinate cards from the input grid onto the processed one: spatial
// axes upsampled by `factor` after cropping `margin` input pixels from each
// edge, spectral axis (3) summed in bins of `spectral_bin` channels.
// CDELT/CD scale, CRPIX shifts; PC and CRVAL are unchanged.
FitsHeader rescale_coordinate_cards(const FitsHeader& cards, int factor, int margin,
                                    int spectral_bin = 1);

// Axis lengths in FITS order (NAXIS1 first).
std::vector<long> get_fits_dimensions(const fs::path& path);

// NAXIS = 3, or 4 with NAXIS4 = 1. FitsError otherwise.
std::pair<Cube3Df, FitsHeader> read_fits_cube(const fs::path& path);

// NAXIS >= 2 with every axis above the second of length 1.
std::pair<Matrix2Df, FitsHeader> read_fits_image(const fs::path& path);
std::pair<Matrix2Di, FitsHeader> read_fits_labels(const fs::path& path);

void write_fits_labels(const fs::path& path, const LabelVolume& labels, const FitsHeader& header);
void write_fits_labels(const fs::path& path, const Matrix2Di& labels, const FitsHeader& header);

} // namespace gas_deblend::io
