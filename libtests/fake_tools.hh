#ifndef FAKE_TOOLS_HH
#define FAKE_TOOLS_HH

// Stand-ins for ImageMagick and Ghostscript used by the conversion tests. They are small shell
// scripts that only use shell builtins, so PATH can point at their directory alone. Their
// behavior is controlled by environment variables:
//
// FAKE_PAGES          number of page images "magick -density" writes (default 1)
// FAKE_RASTER_FAIL    rasterizing exits with status 1
// FAKE_RASTER_SIGNAL  rasterizing sends SIGTERM to the process that started it
// FAKE_ASSEMBLE_FAIL  reassembling exits with status 1
// FAKE_ASSEMBLE_SIGNAL reassembling writes a partial output file and then sends SIGTERM to the
//                     process that started it
// FAKE_GS_FAIL        gs exits with status 1
//
// Reassembly writes "%PDF-1.4" followed by "% pages: <n>" and, on separate lines, the page image
// names in the order received. gs copies its input and appends "% optimized".

#include <trustpdf/TUtil.hh>

#include <cstdlib>
#include <string>
#include <sys/stat.h>

namespace fake_tools
{
    inline char const* magick_script = R"(#!/bin/sh
if [ "$1" = "-density" ]; then
    if [ -n "$FAKE_RASTER_SIGNAL" ]; then
        kill -TERM $PPID
        exit 0
    fi
    [ -n "$FAKE_RASTER_FAIL" ] && exit 1
    [ -f "${3#pdf:}" ] || exit 1
    out=${4#png:}
    i=0
    while [ $i -lt ${FAKE_PAGES:-1} ]; do
        f=$(printf "$out" $i)
        printf 'page %d\n' $i > "$f"
        i=$((i + 1))
    done
    exit 0
fi
[ -n "$FAKE_ASSEMBLE_FAIL" ] && exit 1
if [ -n "$FAKE_ASSEMBLE_SIGNAL" ]; then
    for a in "$@"; do
        case $a in
            pdf:*) printf '%%PDF-1.4\n' > "${a#pdf:}" ;;
        esac
    done
    kill -TERM $PPID
    exit 0
fi
n=0
out=
names=
for a in "$@"; do
    case $a in
        png:*)
            [ -f "${a#png:}" ] || exit 1
            n=$((n + 1))
            names="$names${a##*/}
"
            ;;
        pdf:*)
            out=${a#pdf:}
            ;;
    esac
done
[ -n "$out" ] || exit 1
printf '%%PDF-1.4\n%% pages: %d\n%s' $n "$names" > "$out"
)";

    inline char const* gs_script = R"(#!/bin/sh
[ -n "$FAKE_GS_FAIL" ] && exit 1
out=
in=
for a in "$@"; do
    case $a in
        -sOutputFile=*) out=${a#-sOutputFile=} ;;
        -*) ;;
        *) in=$a ;;
    esac
done
[ -f "$in" ] || exit 1
while IFS= read -r line; do
    printf '%s\n' "$line"
done < "$in" > "$out"
printf '%% optimized\n' >> "$out"
)";

    inline void
    write_file(std::string const& path, std::string const& data, mode_t mode = 0644)
    {
        FILE* f = TUtil::safe_fopen(path.c_str(), "wb");
        {
            TUtil::FileCloser fc(f);
            fputs(data.c_str(), f);
        }
        TUtil::os_wrapper("chmod " + path, chmod(path.c_str(), mode));
    }

    inline std::string
    read_file(std::string const& path)
    {
        return TUtil::read_file_prefix(path.c_str(), 1 << 20);
    }

    inline void
    make_dir(std::string const& path)
    {
        TUtil::os_wrapper("mkdir " + path, mkdir(path.c_str(), 0700));
    }

    // A private test area: bin holds the stand-ins and is the only PATH entry, tmp is TMPDIR, and
    // work is where test files go. Everything is removed by the destructor.
    class Area
    {
      public:
        Area(bool with_gs = true) :
            base(TUtil::make_temp_directory("trustpdf-test-")),
            bin(base + "/bin"),
            tmp(base + "/tmp"),
            work(base + "/work")
        {
            make_dir(bin);
            make_dir(tmp);
            make_dir(work);
            write_file(bin + "/magick", magick_script, 0755);
            if (with_gs) {
                write_file(bin + "/gs", gs_script, 0755);
            }
            setenv("PATH", bin.c_str(), 1);
            setenv("TMPDIR", tmp.c_str(), 1);
            for (auto var:
                 {"FAKE_PAGES",
                  "FAKE_RASTER_FAIL",
                  "FAKE_RASTER_SIGNAL",
                  "FAKE_ASSEMBLE_FAIL",
                  "FAKE_ASSEMBLE_SIGNAL",
                  "FAKE_GS_FAIL"}) {
                unsetenv(var);
            }
        }
        ~Area()
        {
            try {
                TUtil::remove_recursively(base.c_str());
            } catch (std::exception&) {
                // leave it for the system to clean up
            }
        }
        Area(Area const&) = delete;
        Area& operator=(Area const&) = delete;

        // True if no scratch directory was left behind.
        bool
        scratchClean() const
        {
            return TUtil::list_directory(tmp.c_str()).empty();
        }

        std::string base;
        std::string bin;
        std::string tmp;
        std::string work;
    };
} // namespace fake_tools

#endif // FAKE_TOOLS_HH
