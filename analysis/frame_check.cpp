// frame_check --infile path [--nframes N] [--every N] [--pgm_frame N --pgm path]
//
// check that a frame file can be read:
// print its nominal frame rate, frame size,
// and min/max/mean (and frame metric) of every Nth frame.
// Optionally write one frame as a PGM image, scaled to 0..255,
// to see where the light source is.

#include <stdio.h>
#include <string.h>
#include <stdlib.h>

#include "frame_source.h"
#include "frame_metric.h"

void usage() {
    printf("options:\n"
        "   --infile x          frame file (.pff, .fits, .h5)\n"
        "   --dataset x         HDF5 dataset (default /frames)\n"
        "   --nframes n         read only first n frames\n"
        "   --every n           print stats of every nth frame (default 100)\n"
        "   --topk n            pixels in topk metric (default 200)\n"
        "   --pgm_frame n       frame to write as PGM\n"
        "   --pgm x             PGM file name\n"
    );
    exit(1);
}

int write_pgm(const char* path, const FRAME& frame) {
    FILE* f = fopen(path, "wb");
    if (!f) return -1;
    int n = frame.npixels();
    double lo = 0, hi = 0;
    for (int i=0; i<n; i++) {
        double v = frame.pix[i];
        if (i==0 || v<lo) lo = v;
        if (i==0 || v>hi) hi = v;
    }
    fprintf(f, "P5\n%d %d\n255\n", frame.nx, frame.ny);
    for (int i=0; i<n; i++) {
        int x = 0;
        if (hi > lo) {
            x = (int)(255*(frame.pix[i]-lo)/(hi-lo));
        }
        fputc(x, f);
    }
    fclose(f);
    return 0;
}

int main(int argc, char **argv) {
    const char* infile = 0;
    const char* dataset = 0;
    const char* pgm_file = 0;
    long nframes = 0;
    long every = 100;
    long pgm_frame = -1;
    METRIC_PARAMS mp;
    int i, retval;

    for (i=1; i<argc; i++) {
        if (i+1 >= argc) {
            printf("missing value for %s\n", argv[i]);
            usage();
        }
        if (!strcmp(argv[i], "--infile")) {
            infile = argv[++i];
        } else if (!strcmp(argv[i], "--dataset")) {
            dataset = argv[++i];
        } else if (!strcmp(argv[i], "--nframes")) {
            nframes = atol(argv[++i]);
        } else if (!strcmp(argv[i], "--every")) {
            every = atol(argv[++i]);
        } else if (!strcmp(argv[i], "--topk")) {
            mp.topk = atoi(argv[++i]);
        } else if (!strcmp(argv[i], "--pgm_frame")) {
            pgm_frame = atol(argv[++i]);
        } else if (!strcmp(argv[i], "--pgm")) {
            pgm_file = argv[++i];
        } else {
            printf("unrecognized arg %s\n", argv[i]);
            usage();
        }
    }
    if (!infile || every < 1) usage();
    if ((pgm_frame >= 0) != (pgm_file != 0)) {
        fprintf(stderr, "error: --pgm_frame and --pgm go together\n");
        exit(1);
    }

    FRAME_SOURCE_HOLDER holder(make_frame_source(infile, dataset));
    if (!holder.fs) {
        fprintf(stderr, "error: %s: unknown file type\n", infile);
        exit(1);
    }
    retval = holder.fs->open(infile);
    if (retval) {
        fprintf(stderr, "error: %s: %s\n", infile, frame_error_name(retval));
        exit(1);
    }
    double fps = holder.fs->nominal_frame_rate();
    if (frame_rate_valid(fps)) {
        printf("nominal frame rate: %.3f fps\n", fps);
    } else {
        printf("nominal frame rate: unknown\n");
    }

    FRAME frame;
    long iframe = 0;
    int nx = -1, ny = -1;
    while (nframes == 0 || iframe < nframes) {
        retval = holder.fs->next_frame(frame);
        if (retval == FRAME_SOURCE_EOF) break;
        if (retval) {
            fprintf(stderr, "error: frame %ld: %s\n",
                iframe, frame_error_name(retval)
            );
            exit(1);
        }
        if (frame.nx != nx || frame.ny != ny) {
            printf("frame %ld: size %d x %d\n", iframe, frame.nx, frame.ny);
            nx = frame.nx;
            ny = frame.ny;
        }
        if (iframe % every == 0) {
            double lo=0, hi=0, sum=0;
            int n = frame.npixels();
            for (int j=0; j<n; j++) {
                double v = frame.pix[j];
                if (j==0 || v<lo) lo = v;
                if (j==0 || v>hi) hi = v;
                sum += v;
            }
            printf("frame %ld: min %.1f max %.1f mean %.3f topk %.3f\n",
                iframe, lo, hi, n?sum/n:0., frame_metric(frame, mp)
            );
        }
        if (iframe == pgm_frame) {
            if (write_pgm(pgm_file, frame)) {
                fprintf(stderr, "error: can't write %s\n", pgm_file);
                exit(1);
            }
            printf("wrote frame %ld to %s\n", iframe, pgm_file);
        }
        iframe++;
    }
    printf("%ld frames\n", iframe);
    if (pgm_frame >= iframe) {
        fprintf(stderr, "warning: no frame %ld; PGM not written\n", pgm_frame);
    }
    return 0;
}
