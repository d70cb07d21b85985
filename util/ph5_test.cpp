// test the HDF5 frame source:
// write a file with one frame set and one with numbered frame sets,
// and read them back

#include <stdio.h>
#include <stdlib.h>
#include <stdint.h>

#include "hdf5.h"

#include "test_util.h"
#include "ph5.h"

#define SINGLE_FILE     "test_single.h5"
#define NUMBERED_FILE   "test_numbered.h5"
#define ARRAY_ATTR_FILE "test_array_attr.h5"
#define NX              5
#define NY              4
#define SET_FRAMES      3

// pixel (x,y) of frame i
//
uint16_t pixel_value(int i, int x, int y) {
    return 100*i + 10*y + x;
}

void h5_check(hid_t status, const char* where) {
    if (status < 0) {
        printf("HDF5 error in %s\n", where);
        exit(1);
    }
}

void write_attr(hid_t obj_id, const char* name, double value) {
    hid_t space_id = H5Screate(H5S_SCALAR);
    hid_t att_id = H5Acreate2(
        obj_id, name, H5T_NATIVE_DOUBLE, space_id, H5P_DEFAULT, H5P_DEFAULT
    );
    h5_check(att_id, "Acreate");
    h5_check(H5Awrite(att_id, H5T_NATIVE_DOUBLE, &value), "Awrite");
    H5Aclose(att_id);
    H5Sclose(space_id);
}

// frames first_frame.. of a frame set; return the dataset
//
hid_t write_set(hid_t file_id, const char* name, int first_frame, int nframes) {
    hsize_t dims[3] = {(hsize_t)nframes, NY, NX};
    vector<uint16_t> data(nframes*NY*NX);
    for (int i=0; i<nframes; i++) {
        for (int y=0; y<NY; y++) {
            for (int x=0; x<NX; x++) {
                data[(i*NY + y)*NX + x] = pixel_value(first_frame+i, x, y);
            }
        }
    }
    hid_t space_id = H5Screate_simple(3, dims, NULL);
    hid_t dataset_id = H5Dcreate2(
        file_id, name, H5T_STD_U16LE, space_id,
        H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT
    );
    h5_check(dataset_id, "Dcreate");
    h5_check(
        H5Dwrite(dataset_id, H5T_NATIVE_UINT16, H5S_ALL, H5S_ALL, H5P_DEFAULT, &data[0]),
        "Dwrite"
    );
    H5Sclose(space_id);
    return dataset_id;
}

void write_single() {
    hid_t file_id = H5Fcreate(SINGLE_FILE, H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    h5_check(file_id, "Fcreate");
    hid_t dataset_id = write_set(file_id, PH5_DEFAULT_DATASET, 0, SET_FRAMES);
    write_attr(dataset_id, "frame_rate", 400);
    H5Dclose(dataset_id);
    H5Fclose(file_id);
}

void write_numbered() {
    hid_t file_id = H5Fcreate(NUMBERED_FILE, H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    h5_check(file_id, "Fcreate");
    hid_t group_id = H5Gcreate2(file_id, "/cam", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    h5_check(group_id, "Gcreate");
    H5Gclose(group_id);
    for (int k=0; k<2; k++) {
        string name = frame_set_name("/cam/set", k);
        H5Dclose(write_set(file_id, name.c_str(), k*SET_FRAMES, SET_FRAMES));
    }
    write_attr(file_id, "frame_rate", 120);
    H5Fclose(file_id);
}

// frame_rate stored as a 64-element array; the reader must not
// take it as a rate
//
void write_array_attr() {
    hid_t file_id = H5Fcreate(ARRAY_ATTR_FILE, H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    h5_check(file_id, "Fcreate");
    hid_t dataset_id = write_set(file_id, PH5_DEFAULT_DATASET, 0, SET_FRAMES);
    hsize_t n = 64;
    vector<double> rates(n, 300);
    hid_t space_id = H5Screate_simple(1, &n, NULL);
    hid_t att_id = H5Acreate2(
        dataset_id, "frame_rate", H5T_NATIVE_DOUBLE, space_id, H5P_DEFAULT, H5P_DEFAULT
    );
    h5_check(att_id, "Acreate");
    h5_check(H5Awrite(att_id, H5T_NATIVE_DOUBLE, &rates[0]), "Awrite");
    H5Aclose(att_id);
    H5Sclose(space_id);
    H5Dclose(dataset_id);
    H5Fclose(file_id);
}

void read_back(const char* path, const char* dataset, int nframes, double fps) {
    FRAME_SOURCE_HOLDER holder(make_frame_source(path, dataset));
    check(holder.fs != NULL, "HDF5 source by extension");
    if (!holder.fs) return;
    check(holder.fs->open(path) == 0, "open");
    check(near(holder.fs->nominal_frame_rate(), fps), "frame_rate attribute");

    FRAME frame;
    for (int i=0; i<nframes; i++) {
        check(holder.fs->next_frame(frame) == 0, "read frame");
        check(frame.nx == NX && frame.ny == NY, "frame size");
        bool ok = frame.npixels() == NX*NY;
        for (int y=0; ok && y<NY; y++) {
            for (int x=0; x<NX; x++) {
                if (frame.pix[y*NX + x] != pixel_value(i, x, y)) ok = false;
            }
        }
        check(ok, "pixel values");
    }
    check(holder.fs->next_frame(frame) == FRAME_SOURCE_EOF, "EOF");
}

int main(int, char**) {
    check(frame_set_name("/cam/set", 12) == "/cam/set000000012", "frame set name");

    write_single();
    write_numbered();
    read_back(SINGLE_FILE, NULL, SET_FRAMES, 400);
    read_back(NUMBERED_FILE, "/cam/set", 2*SET_FRAMES, 120);

    // array-valued rate is ignored; frames still read
    //
    write_array_attr();
    read_back(ARRAY_ATTR_FILE, NULL, SET_FRAMES, 0);
    PH5_SOURCE asrc;
    check(asrc.open(ARRAY_ATTR_FILE) == 0, "open array attr");
    bool used_fallback;
    double fps = resolve_frame_rate(0, asrc.nominal_frame_rate(), 110, used_fallback);
    check(used_fallback && near(fps, 110), "array attr: fallback rate");
    asrc.close();

    PH5_SOURCE src;
    src.dataset = "/nothing";
    check(src.open(SINGLE_FILE) == FRAME_ERROR_FORMAT, "missing dataset");
    src.close();
    check(src.open("no_such_file.h5") == FRAME_ERROR_OPEN, "missing file");

    remove(SINGLE_FILE);
    remove(NUMBERED_FILE);
    remove(ARRAY_ATTR_FILE);
    return test_result("ph5_test");
}
