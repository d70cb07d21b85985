// functions for getting frames from an HDF5 file

#include <stdio.h>

#include "ph5.h"

string frame_set_name(const string& base, int i) {
    char buf[32];
    sprintf(buf, "%09d", i);
    return base + buf;
}

bool PH5_SOURCE::exists(const char* name) {
    // H5Lexists() fails (< 0) if an intermediate group is missing
    //
    return H5Lexists(file_id, name, H5P_DEFAULT) > 0;
}

// a numeric scalar (or 1-element) attribute;
// anything else is treated as missing
//
int PH5_SOURCE::get_attr(const char* obj_name, const char* name, double& value) {
    if (H5Aexists_by_name(file_id, obj_name, name, H5P_DEFAULT) <= 0) {
        return -1;
    }
    hid_t att_id = H5Aopen_by_name(file_id, obj_name, name, H5P_DEFAULT, H5P_DEFAULT);
    if (att_id < 0) return -1;
    hid_t space_id = H5Aget_space(att_id);
    hid_t type_id = H5Aget_type(att_id);
    H5T_class_t tclass = H5Tget_class(type_id);
    hssize_t npoints = H5Sget_simple_extent_npoints(space_id);
    int retval = -1;
    if (npoints == 1 && (tclass == H5T_INTEGER || tclass == H5T_FLOAT)) {
        double x;
        if (H5Aread(att_id, H5T_NATIVE_DOUBLE, &x) >= 0) {
            value = x;
            retval = 0;
        }
    } else {
        fprintf(stderr, "attribute %s of %s is not a number; ignoring\n",
            name, obj_name
        );
    }
    H5Tclose(type_id);
    H5Sclose(space_id);
    H5Aclose(att_id);
    return retval;
}

int FRAME_SET::open(hid_t file_id, const char* name) {
    close();
    dataset_id = H5Dopen2(file_id, name, H5P_DEFAULT);
    if (dataset_id < 0) {
        fprintf(stderr, "no dataset %s\n", name);
        return FRAME_ERROR_FORMAT;
    }
    space_id = H5Dget_space(dataset_id);
    rank = H5Sget_simple_extent_ndims(space_id);
    hsize_t dims[3] = {0, 0, 0};
    if (rank == 3) {
        H5Sget_simple_extent_dims(space_id, dims, NULL);
        nframes = (int)dims[0];
        ny = (int)dims[1];
        nx = (int)dims[2];
    } else if (rank == 2) {
        H5Sget_simple_extent_dims(space_id, dims, NULL);
        nframes = 1;
        ny = (int)dims[0];
        nx = (int)dims[1];
    } else {
        fprintf(stderr, "dataset %s: unexpected rank %d\n", name, rank);
        close();
        return FRAME_ERROR_FORMAT;
    }
    return 0;
}

// read frame iframe into p (ny*nx values)
//
int FRAME_SET::read_frame(int iframe, double* p) {
    hsize_t start[3] = {(hsize_t)iframe, 0, 0};
    hsize_t count[3] = {1, (hsize_t)ny, (hsize_t)nx};
    if (rank == 2) {
        start[0] = 0;
        count[0] = (hsize_t)ny;
        count[1] = (hsize_t)nx;
    }
    if (H5Sselect_hyperslab(space_id, H5S_SELECT_SET, start, NULL, count, NULL) < 0) {
        return FRAME_ERROR_READ;
    }
    hsize_t mem_dims[1] = {(hsize_t)ny*nx};
    hid_t mem_id = H5Screate_simple(1, mem_dims, NULL);
    herr_t status = H5Dread(
        dataset_id, H5T_NATIVE_DOUBLE, mem_id, space_id, H5P_DEFAULT, p
    );
    H5Sclose(mem_id);
    if (status < 0) {
        fprintf(stderr, "frame %d: read failed\n", iframe);
        return FRAME_ERROR_READ;
    }
    return 0;
}

void FRAME_SET::close() {
    if (space_id >= 0) {
        H5Sclose(space_id);
        space_id = -1;
    }
    if (dataset_id >= 0) {
        H5Dclose(dataset_id);
        dataset_id = -1;
    }
    rank = nframes = ny = nx = 0;
}

int PH5_SOURCE::open(const char* path) {
    // we check for missing objects ourselves;
    // don't let the library print its error stack
    //
    H5Eset_auto2(H5E_DEFAULT, NULL, NULL);

    file_id = H5Fopen(path, H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_id < 0) return FRAME_ERROR_OPEN;

    string name;
    if (exists(dataset.c_str())) {
        numbered = false;
        name = dataset;
    } else {
        name = frame_set_name(dataset, 0);
        if (!exists(name.c_str())) {
            fprintf(stderr, "%s: no dataset %s\n", path, dataset.c_str());
            return FRAME_ERROR_FORMAT;
        }
        numbered = true;
    }
    iset = 0;
    iframe = 0;
    if (get_attr(name.c_str(), "frame_rate", fps)
        && get_attr("/", "frame_rate", fps)
    ) {
        fps = 0;
    }
    return fs.open(file_id, name.c_str());
}

int PH5_SOURCE::next_frame(FRAME& frame) {
    while (iframe >= fs.nframes) {
        if (!numbered) return FRAME_SOURCE_EOF;
        string name = frame_set_name(dataset, iset+1);
        if (!exists(name.c_str())) return FRAME_SOURCE_EOF;
        int retval = fs.open(file_id, name.c_str());
        if (retval) return retval;
        iset++;
        iframe = 0;
    }
    frame.resize(fs.nx, fs.ny);
    if (frame.npixels()) {
        int retval = fs.read_frame(iframe, &frame.pix[0]);
        if (retval) return retval;
    }
    iframe++;
    return 0;
}

void PH5_SOURCE::close() {
    fs.close();
    if (file_id >= 0) {
        H5Fclose(file_id);
        file_id = -1;
    }
}
