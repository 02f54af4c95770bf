// gzcat.cpp

#include "gzio/binary_file.hpp"
#include "gzio/text_file.hpp"
#include "compression/error.hpp"

#include <boost/program_options.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;
namespace fs = std::filesystem;
using namespace std;

namespace {
    constexpr char const * c_suffix = ".gz";
    constexpr size_t c_suffix_z = 3;

    struct gzcat_config {
        bool text_flag = false;
        bool keep_flag = false;
        bool verbose_flag = false;
        gzio::open_options opts;
    };

    void
    compress_file(string const & fname, string const & fname_gz, gzcat_config const & cfg)
    {
        ifstream in(fname, ios::in | ios::binary);

        if (!in)
            throw gzio::resource_error("open", 0, "can't open input file '" + fname + "'");

        if (cfg.text_flag) {
            auto out = gzio::text_file::open(fname_gz, "wt", cfg.opts);

            /* whole lines,  so multibyte characters are never split */
            string line;
            while (std::getline(in, line)) {
                if (!in.eof())
                    line.push_back('\n');
                out->write(line);
            }

            out->close();
        } else {
            auto out = gzio::binary_file::open(fname_gz, "wb", cfg.opts);

            string buf(cfg.opts.chunk_size, '\0');
            while (in) {
                in.read(&buf[0], buf.size());
                out->write(string_view(buf.data(), in.gcount()));
            }

            out->close();
        }
    }

    void
    decompress_file(string const & fname_gz, string const & fname, gzcat_config const & cfg)
    {
        ofstream out(fname, ios::out | ios::binary | ios::trunc);

        if (!out)
            throw gzio::resource_error("open", 0, "can't open output file '" + fname + "'");

        if (cfg.text_flag) {
            auto in = gzio::text_file::open(fname_gz, "rt", cfg.opts);

            for (string const & line : in->lines())
                out << line;
        } else {
            auto in = gzio::binary_file::open(fname_gz, "rb", cfg.opts);

            while (true) {
                string chunk = in->read1(cfg.opts.chunk_size);

                if (chunk.empty())
                    break;

                out.write(chunk.data(), chunk.size());
            }
        }

        out.close();

        if (!out)
            throw gzio::resource_error("write", 0, "error writing output file '" + fname + "'");
    }
}

int
main(int argc, char * argv[]) {
    po::options_description po_descr{"Options"};
    po_descr.add_options()
        ("help,h",
         "this help")
        ("decompress,d",
         "decompress .gz files instead of compressing")
        ("level,l",
         po::value<int>()->default_value(6),
         "compression level: -1 (zlib default) or 0..9")
        ("chunk-size,c",
         po::value<uint64_t>()->default_value(gzio::open_options::c_default_chunk_size),
         "i/o chunk size in bytes")
        ("mtime",
         po::value<int64_t>(),
         "mtime to record in gzip header (default: now)")
        ("name",
         po::value<string>(),
         "original filename to record in gzip header (default: input file name)")
        ("text,t",
         "process as text (see --encoding, --newline)")
        ("encoding",
         po::value<string>(),
         "text encoding of the uncompressed stream")
        ("newline",
         po::value<string>(),
         "newline mode: universal, none, lf, cr, crlf")
        ("keep,k",
         "keep input files instead of deleting them")
        ("verbose,v",
         "enable to report progress messages to stderr")
        ("input-file",
         po::value<vector<string>>(),
         "input file(s) to compress/uncompress")
        ;

    po::variables_map vm;

    po::positional_options_description po_pos_args;
    po_pos_args.add("input-file", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                  .options(po_descr)
                  .positional(po_pos_args)
                  .run(),
                  vm);
        po::notify(vm);
    } catch (po::error & ex) {
        cerr << "error: gzcat: " << ex.what() << endl;
        return 2;
    }

    if (vm.count("help")) {
        cerr << po_descr << endl;
        return 0;
    }

    if (!vm.count("input-file")) {
        cerr << "error: gzcat: no input files" << endl << po_descr << endl;
        return 2;
    }

    gzcat_config cfg;
    cfg.text_flag = vm.count("text");
    cfg.keep_flag = vm.count("keep");
    cfg.verbose_flag = vm.count("verbose");

    bool decompress_flag = vm.count("decompress");

    try {
        cfg.opts.compresslevel = vm["level"].as<int>();
        cfg.opts.chunk_size = vm["chunk-size"].as<uint64_t>();

        if (vm.count("mtime"))
            cfg.opts.mtime = vm["mtime"].as<int64_t>();
        if (vm.count("name"))
            cfg.opts.original_filename = vm["name"].as<string>();

        if (vm.count("encoding") || vm.count("newline")) {
            if (!cfg.text_flag)
                throw gzio::invalid_argument("--encoding and --newline require --text");

            if (vm.count("encoding"))
                cfg.opts.encoding = vm["encoding"].as<string>();

            if (vm.count("newline")) {
                string nl = vm["newline"].as<string>();

                if (nl == "universal")
                    cfg.opts.newline.reset();
                else if (nl == "none")
                    cfg.opts.newline = "";
                else if (nl == "lf")
                    cfg.opts.newline = "\n";
                else if (nl == "cr")
                    cfg.opts.newline = "\r";
                else if (nl == "crlf")
                    cfg.opts.newline = "\r\n";
                else
                    throw gzio::invalid_argument("unknown --newline value '" + nl + "'");
            }
        }

        vector<string> input_file_l = vm["input-file"].as<vector<string>>();

        for (string const & fname : input_file_l) {
            if (cfg.verbose_flag)
                cerr << "gzcat: consider file [" << fname << "]" << endl;

            string fname_in = fname;
            string fname_out;

            if (decompress_flag) {
                if ((fname.size() <= c_suffix_z) || (fname.substr(fname.size() - c_suffix_z) != c_suffix))
                    throw gzio::invalid_argument("'" + fname + "': unknown suffix, expected " + c_suffix);

                fname_out = fname.substr(0, fname.size() - c_suffix_z);

                decompress_file(fname_in, fname_out, cfg);
            } else {
                fname_out = fname + c_suffix;

                compress_file(fname_in, fname_out, cfg);
            }

            if (cfg.verbose_flag) {
                uintmax_t z_in = fs::file_size(fname_in);
                uintmax_t z_out = fs::file_size(fname_out);

                cerr << "gzcat: " << fname_in << " (" << z_in << " bytes) -> "
                     << fname_out << " (" << z_out << " bytes)" << endl;
            }

            if (!cfg.keep_flag)
                fs::remove(fname_in);
        }
    } catch (exception & ex) {
        cerr << "error: gzcat: " << ex.what() << endl;
        return 1;
    }

    return 0;
}

/* end gzcat.cpp */
