#include "qcpack.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using json = nlohmann::json;

static bool read_file(const char* path, std::vector<char>& buf) {
    FILE* f = fopen(path, "rb");
    if (!f) { perror(path); return false; }
    fseek(f, 0, SEEK_END);
    long sz = ftell(f);
    rewind(f);
    buf.resize(sz > 0 ? static_cast<size_t>(sz) : 0);
    if (fread(buf.data(), 1, buf.size(), f) != buf.size()) {
        fclose(f);
        fprintf(stderr, "%s: read error\n", path);
        return false;
    }
    fclose(f);
    return true;
}

static bool write_file(const char* path, const unsigned char* data, size_t len) {
    FILE* f = fopen(path, "wb");
    if (!f) { perror(path); return false; }
    bool ok = fwrite(data, 1, len, f) == len;
    if (fclose(f) != 0) ok = false;
    if (!ok) fprintf(stderr, "%s: write error\n", path);
    return ok;
}

static int print_diag(const char* line, void*) {
    fprintf(stderr, "qcpack: %s\n", line);
    return 0;
}

static void usage(const char* argv0) {
    fprintf(stderr,
            "usage: %s <report.csv|xlsx> <script.pdf> <out.pdf>\n"
            "          [--offset N] [--audible] [--post-qc] [--config file.json]\n"
            "          [--list] [--print-config]\n",
            argv0);
}

int main(int argc, char* argv[]) {
    std::vector<const char*> paths;
    json config = json::object();
    const char* config_path = nullptr;
    bool list = false, print_config = false;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (!strcmp(a, "--offset") && i + 1 < argc) {
            config["page_offset"] = std::atoi(argv[++i]);
        } else if (!strcmp(a, "--audible")) {
            config["audible"] = true;
        } else if (!strcmp(a, "--post-qc")) {
            config["dialect"] = "post-qc";
        } else if (!strcmp(a, "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (!strcmp(a, "--list")) {
            list = true;
        } else if (!strcmp(a, "--print-config")) {
            print_config = true;
        } else if (a[0] == '-' && a[1] == '-') {
            usage(argv[0]);
            return 1;
        } else {
            paths.push_back(a);
        }
    }

    /* command-line flags override the config file */
    if (config_path) {
        std::vector<char> text;
        if (!read_file(config_path, text)) return 1;
        json file = json::parse(text.begin(), text.end(), nullptr, false);
        if (file.is_discarded() || !file.is_object()) {
            fprintf(stderr, "%s: not a JSON object\n", config_path);
            return 1;
        }
        file.update(config);
        config = std::move(file);
    }

    qcpack_session* s = qcpack_open(config.dump().c_str());
    if (!s) {
        fprintf(stderr, "invalid configuration: %s\n", qcpack_last_error(nullptr));
        return 1;
    }

    if (print_config) {
        printf("%s\n", qcpack_options_json(s));
        if (paths.empty()) { qcpack_close(s); return 0; }
    }

    if (paths.size() != 3) {
        usage(argv[0]);
        qcpack_close(s);
        return 1;
    }

    qcpack_set_diag_callback(s, print_diag, nullptr);

    std::vector<char> report, script;
    if (!read_file(paths[0], report) || !read_file(paths[1], script)) {
        qcpack_close(s);
        return 1;
    }

    qcpack_init();
    int rc = 1;

    int n = qcpack_load_report(s, report.data(), report.size());
    if (n < 0) {
        fprintf(stderr, "%s: %s\n", paths[0], qcpack_last_error(s));
    } else {
        if (list) {
            while (const char* row = qcpack_next_correction_json(s)) printf("%s\n", row);
        }
        printf("corrections: %d\n", n);

        int pages = qcpack_build_pack(s, script.data(), script.size());
        if (pages < 0) {
            fprintf(stderr, "%s: %s\n", paths[1], qcpack_last_error(s));
        } else {
            size_t len = 0;
            const unsigned char* bytes = qcpack_pack_bytes(s, &len);
            if (bytes && write_file(paths[2], bytes, len)) {
                printf("pages: %d\n", pages);
                rc = 0;
            }
        }
    }

    qcpack_close(s);
    qcpack_destroy();
    return rc;
}
