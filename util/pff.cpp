#include <string.h>
#include <stdlib.h>
#include <stdint.h>
#include <string>
#include <vector>
#include <stdio.h>

#include "rapidjson/document.h"

#include "pff.h"

using std::string;
using std::vector;
using namespace rapidjson;

void pff_start_json(FILE* f) {
}

void pff_end_json(FILE* f) {
    fprintf(f, "\n\n");
}

void pff_write_image(
    FILE* f, int nbytes, void* image
) {
    static char buf = PFF_IMAGE_START;
    fwrite(&buf, 1, 1, f);
    fwrite(image, 1, nbytes, f);
}

int pff_read_json(FILE* f, string &s) {
    char c;
    s.clear();
    while (1) {
        if (fread(&c, 1, 1, f) != 1) {
            return PFF_ERROR_READ;
        }
        if (c == '\n') continue;
        if (c == PFF_JSON_START) {
            break;
        }
        return PFF_ERROR_BAD_TYPE;
    }
    s.append(&c, 1);
    bool last_nl = false;   // last char was newline
    while(1) {
        int x = fgetc(f);
        if (x == EOF) {
            return PFF_ERROR_READ;
        }
        c = (char)x;
        if (c == '\n') {
            if (last_nl) {
                break;
            }
            last_nl = true;
        } else {
            last_nl= false;
        }
        s.append(&c, 1);
    }
    return 0;
}

int pff_read_image(FILE* f, int nbytes, void* img) {
    char c;
    if (fread(&c, 1, 1, f) != 1) {
        return PFF_ERROR_READ;
    }
    if (c != PFF_IMAGE_START) {
        return PFF_ERROR_BAD_TYPE;
    }
    if (fread(img, 1, nbytes, f) != (size_t)nbytes) {
        return PFF_ERROR_READ;
    }
    return 0;
}

////////// FILE NAMES ////////////////

// get comma-separated substrings
//
static void split_comma(const string& name, vector<string> &pieces) {
    size_t p = 0;
    while (1) {
        size_t q = name.find(',', p);
        if (q == string::npos) break;
        pieces.push_back(name.substr(p, q-p));
        p = q+1;
    }
    pieces.push_back(name.substr(p));
}

static int parse_data_product(const char* s, DATA_PRODUCT& dp) {
    if (!strcmp(s, "img16")) {
        dp = DP_BIT16_IMG;
    } else if (!strcmp(s, "img8")) {
        dp = DP_BIT8_IMG;
    } else if (!strcmp(s, "ph256")) {
        dp = DP_PH_256_IMG;
    } else if (!strcmp(s, "ph1024")) {
        dp = DP_PH_1024_IMG;
    } else {
        int x = atoi(s);
        if (x < DP_BIT16_IMG || x >= DP_NONE) return -1;
        dp = (DATA_PRODUCT)x;
    }
    return 0;
}

int FILENAME_INFO::parse_filename(const char* path) {
    const char* p = strrchr(path, '/');
    string name = p?p+1:path;
    size_t dot = name.rfind('.');   // trim .pff
    if (dot == string::npos) return -1;
    name = name.substr(0, dot);

    vector<string> pieces;
    split_comma(name, pieces);
    bool got_bpp = false;
    for (size_t i=0; i<pieces.size(); i++) {
        size_t eq = pieces[i].find('=');
        if (eq == string::npos) continue;
        string n = pieces[i].substr(0, eq);
        string v = pieces[i].substr(eq+1);
        if (n == "dp") {
            if (parse_data_product(v.c_str(), data_product)) {
                fprintf(stderr, "warning: unknown data product %s\n", v.c_str());
            }
        } else if (n == "bpp") {
            bytes_per_pixel = atoi(v.c_str());
            got_bpp = true;
        } else if (n == "module") {
            module = atoi(v.c_str());
        } else if (n == "seqno") {
            seqno = atoi(v.c_str());
        }
    }
    if (!got_bpp) {
        bytes_per_pixel = ::bytes_per_pixel(data_product);
    }
    if (bytes_per_pixel != 1 && bytes_per_pixel != 2) {
        return -1;
    }
    return 0;
}

bool is_pff_file(const char* path) {
    return ends_with(path, ".pff");
}

string dir_of(const char* path) {
    const char* p = strrchr(path, '/');
    if (!p) return ".";
    return string(path, p-path);
}

double pff_config_frame_rate(const char* path) {
    FILE* f = fopen(path, "r");
    if (!f) return 0;
    string s;
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        s.append(buf, n);
    }
    fclose(f);

    Document d;
    if (d.Parse(s.c_str()).HasParseError()) {
        fprintf(stderr, "warning: can't parse %s\n", path);
        return 0;
    }
    if (!d.IsObject() || !d.HasMember("image")) return 0;
    const Value& image = d["image"];
    if (!image.IsObject() || !image.HasMember("integration_time_usec")) {
        return 0;
    }
    const Value& usec = image["integration_time_usec"];
    if (!usec.IsNumber()) return 0;
    double x = usec.GetDouble();
    if (x <= 0) return 0;
    return 1e6/x;
}

////////// FRAME SOURCE ////////////////

int PFF_SOURCE::open(const char* path) {
    if (fi.parse_filename(path)) {
        fprintf(stderr, "bad PFF file name: %s\n", path);
        return FRAME_ERROR_FORMAT;
    }
    f = fopen(path, "rb");
    if (!f) {
        return FRAME_ERROR_OPEN;
    }
    dim = image_dim(fi.data_product);
    buf.resize(dim*dim*fi.bytes_per_pixel);
    string cfg = dir_of(path) + "/" + PFF_DATA_CONFIG;
    fps = pff_config_frame_rate(cfg.c_str());
    return 0;
}

int PFF_SOURCE::next_frame(FRAME& frame) {
    int retval = pff_read_json(f, header);
    if (retval == PFF_ERROR_READ && header.empty()) {
        return FRAME_SOURCE_EOF;
    }
    if (retval) {
        return FRAME_ERROR_READ;
    }
    retval = pff_read_image(f, (int)buf.size(), &buf[0]);
    if (retval) {
        return FRAME_ERROR_READ;
    }
    frame.resize(dim, dim);
    int n = dim*dim;
    if (fi.bytes_per_pixel == 2) {
        const uint16_t* p = (const uint16_t*)&buf[0];
        for (int i=0; i<n; i++) {
            frame.pix[i] = p[i];
        }
    } else {
        for (int i=0; i<n; i++) {
            frame.pix[i] = buf[i];
        }
    }
    return 0;
}

void PFF_SOURCE::close() {
    if (f) {
        fclose(f);
        f = NULL;
    }
}
