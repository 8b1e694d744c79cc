#include "gas_deblend/io/fits_io.hpp"
#include "gas_deblend/core/errors.hpp"
#include "gas_deblend/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace gas_deblend::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto it_int = int_values.find(key);
    if (it_int != int_values.end()) {
        return static_cast<double>(it_int->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool FitsHeader::contains(const std::string& key) const {
    return string_values.count(key) || numeric_values.count(key) || int_values.count(key) ||
           bool_values.count(key);
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

namespace {

constexpr int kMaxAxes = 4;

void copy_card(const FitsHeader& src, const std::string& key, FitsHeader& dst) {
    if (auto s = src.get_string(key)) dst.set(key, *s);
    if (auto i = src.get_int(key)) dst.set(key, *i);
    else if (auto d = src.get_double(key)) dst.set(key, *d);
    if (auto b = src.get_bool(key)) dst.set(key, *b);
}

// Integer-valued cards (CRPIX 64) become floating point once rescaled.
void replace_number(FitsHeader& header, const std::string& key, double value) {
    header.int_values.erase(key);
    header.set(key, value);
}

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype = 'C';
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    return header;
}

struct OpenImage {
    fitsfile* fptr = nullptr;
    int naxis = 0;
    long naxes[kMaxAxes] = {0, 0, 0, 0};
    FitsHeader header;
};

OpenImage open_image(const fs::path& path) {
    OpenImage img;
    int status = 0;

    if (fits_open_image(&img.fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int bitpix = 0;
    fits_get_img_param(img.fptr, kMaxAxes, &bitpix, &img.naxis, img.naxes, &status);
    if (status) {
        fits_close_file(img.fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (img.naxis > kMaxAxes) {
        status = 0;
        fits_close_file(img.fptr, &status);
        throw FitsError("FITS image has more than 4 axes: " + path.string());
    }

    img.header = read_header(img.fptr);
    return img;
}

template <typename T>
void read_pixels(OpenImage& img, const fs::path& path, int datatype, long count, T* out) {
    int status = 0;
    long fpixel[kMaxAxes] = {1, 1, 1, 1};
    fits_read_pix(img.fptr, datatype, fpixel, count, nullptr, out, nullptr, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(img.fptr, &close_status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }
    fits_close_file(img.fptr, &status);
}

void require_plane(OpenImage& img, const fs::path& path) {
    bool ok = img.naxis >= 2;
    for (int a = 2; a < img.naxis; ++a) {
        if (img.naxes[a] != 1) ok = false;
    }
    if (!ok) {
        int status = 0;
        fits_close_file(img.fptr, &status);
        throw FitsError("Expected a 2D image: " + path.string());
    }
}

void write_header_cards(fitsfile* fptr, const FitsHeader& header, int& status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
}

void write_int_image(const fs::path& path, int naxis, long* naxes, const int32_t* data,
                     long count, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    fits_create_img(fptr, LONG_IMG, naxis, naxes, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    write_header_cards(fptr, header, status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    std::vector<int> buffer(data, data + count);
    long fpixel[3] = {1, 1, 1};
    fits_write_pix(fptr, TINT, fpixel, count, buffer.data(), &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace

FitsHeader coordinate_cards(const FitsHeader& header, int naxis) {
    static const char* kPerAxis[] = {"CTYPE", "CRVAL", "CRPIX", "CDELT", "CUNIT", "CROTA"};
    static const char* kGlobal[] = {"RADESYS", "EQUINOX", "SPECSYS", "RESTFRQ", "RESTFREQ",
                                    "OBJECT", "LONPOLE", "LATPOLE"};

    FitsHeader out;
    for (int a = 1; a <= naxis; ++a) {
        const std::string suffix = std::to_string(a);
        for (const char* base : kPerAxis) {
            copy_card(header, base + suffix, out);
        }
        for (int b = 1; b <= naxis; ++b) {
            const std::string pair = suffix + "_" + std::to_string(b);
            copy_card(header, "CD" + pair, out);
            copy_card(header, "PC" + pair, out);
        }
    }
    for (const char* key : kGlobal) {
        copy_card(header, key, out);
    }
    return out;
}

FitsHeader rescale_coordinate_cards(const FitsHeader& cards, int factor, int margin,
                                    int spectral_bin) {
    if (factor < 1 || spectral_bin < 1) {
        throw ValidationError("upsample factor and spectral bin must be >= 1");
    }
    if (margin < 0) {
        throw BoundsError("crop margin must be >= 0");
    }

    FitsHeader out = cards;
    const double k = static_cast<double>(factor);
    const double n = static_cast<double>(spectral_bin);

    for (int a = 1; a <= 2; ++a) {
        const std::string suffix = std::to_string(a);
        if (auto crpix = cards.get_double("CRPIX" + suffix)) {
            replace_number(out, "CRPIX" + suffix, (*crpix - 0.5) * k + 0.5 - margin * k);
        }
        if (auto cdelt = cards.get_double("CDELT" + suffix)) {
            replace_number(out, "CDELT" + suffix, *cdelt / k);
        }
        for (int b = 1; b <= 2; ++b) {
            const std::string key = "CD" + suffix + "_" + std::to_string(b);
            if (auto cd = cards.get_double(key)) {
                replace_number(out, key, *cd / k);
            }
        }
    }

    if (spectral_bin > 1) {
        if (auto crpix = cards.get_double("CRPIX3")) {
            replace_number(out, "CRPIX3", (*crpix - 0.5) / n + 0.5);
        }
        if (auto cdelt = cards.get_double("CDELT3")) {
            replace_number(out, "CDELT3", *cdelt * n);
        }
        if (auto cd = cards.get_double("CD3_3")) {
            replace_number(out, "CD3_3", *cd * n);
        }
    }
    return out;
}

std::vector<long> get_fits_dimensions(const fs::path& path) {
    OpenImage img = open_image(path);
    int status = 0;
    fits_close_file(img.fptr, &status);
    return std::vector<long>(img.naxes, img.naxes + img.naxis);
}

std::pair<Cube3Df, FitsHeader> read_fits_cube(const fs::path& path) {
    OpenImage img = open_image(path);
    if (img.naxis < 3 || (img.naxis == 4 && img.naxes[3] != 1)) {
        int status = 0;
        fits_close_file(img.fptr, &status);
        throw FitsError("Expected a 3D cube (NAXIS=3, or NAXIS=4 with NAXIS4=1): " +
                        path.string());
    }

    Cube3Df cube(static_cast<int>(img.naxes[2]), static_cast<int>(img.naxes[1]),
                 static_cast<int>(img.naxes[0]));
    read_pixels(img, path, TFLOAT, static_cast<long>(cube.size()), cube.data.data());

    // Blanked voxels carry no flux.
    for (float& v : cube.data) {
        if (std::isnan(v)) v = 0.0f;
    }
    return {std::move(cube), std::move(img.header)};
}

std::pair<Matrix2Df, FitsHeader> read_fits_image(const fs::path& path) {
    OpenImage img = open_image(path);
    require_plane(img, path);

    Matrix2Df data(img.naxes[1], img.naxes[0]);
    read_pixels(img, path, TFLOAT, static_cast<long>(data.size()), data.data());
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        if (std::isnan(data.data()[i])) data.data()[i] = 0.0f;
    }
    return {std::move(data), std::move(img.header)};
}

std::pair<Matrix2Di, FitsHeader> read_fits_labels(const fs::path& path) {
    OpenImage img = open_image(path);
    require_plane(img, path);

    std::vector<int> buffer(static_cast<size_t>(img.naxes[0] * img.naxes[1]));
    read_pixels(img, path, TINT, static_cast<long>(buffer.size()), buffer.data());

    Matrix2Di labels(img.naxes[1], img.naxes[0]);
    std::copy(buffer.begin(), buffer.end(), labels.data());
    return {std::move(labels), std::move(img.header)};
}

void write_fits_labels(const fs::path& path, const LabelVolume& labels, const FitsHeader& header) {
    long naxes[3] = {labels.cols(), labels.rows(), labels.depth()};
    write_int_image(path, 3, naxes, labels.data.data(), static_cast<long>(labels.size()), header);
}

void write_fits_labels(const fs::path& path, const Matrix2Di& labels, const FitsHeader& header) {
    long naxes[2] = {static_cast<long>(labels.cols()), static_cast<long>(labels.rows())};
    write_int_image(path, 2, naxes, labels.data(), static_cast<long>(labels.size()), header);
}

} // namespace gas_deblend::io
