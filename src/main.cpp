#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include "descriptor.hpp"
#include "diag.hpp"
#include "parse.hpp"
#include "project.hpp"
#include "template.hpp"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [-I <dir>]... [--dump-tokens] [--dump-tree] [--dump-json] "
                 "[--job <template> <suffix>] <file.proto>...\n";
}

static int dump_file_tokens(const std::string& path) {
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (std::error_code ec = buffer.getError()) {
        std::cerr << path << ": error: " << ec.message() << "\n";
        return 1;
    }
    protodesc::dump_tokens(protodesc::kNoFile, (*buffer)->getBuffer().str(), std::cout);
    return 0;
}

int main(int argc, char** argv) {
    bool dump_tokens = false;
    bool dump_tree = false;
    bool dump_json = false;
    std::optional<std::string_view> job_template{};
    std::optional<std::string_view> job_suffix{};
    std::vector<std::filesystem::path> include_dirs{};
    std::vector<std::string> inputs{};

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--dump-tokens") {
            dump_tokens = true;
            continue;
        }
        if (arg == "--dump-tree") {
            dump_tree = true;
            continue;
        }
        if (arg == "--dump-json") {
            dump_json = true;
            continue;
        }
        if (arg == "-I") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            include_dirs.emplace_back(argv[++i]);
            continue;
        }
        if (arg.size() > 2 && arg.substr(0, 2) == "-I") {
            include_dirs.emplace_back(std::string(arg.substr(2)));
            continue;
        }
        if (arg == "--job") {
            if (i + 2 >= argc) {
                usage(argv[0]);
                return 2;
            }
            job_template = std::string_view(argv[++i]);
            job_suffix = std::string_view(argv[++i]);
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            usage(argv[0]);
            return 2;
        }
        inputs.emplace_back(arg);
    }

    if (inputs.empty()) {
        usage(argv[0]);
        return 2;
    }

    if (dump_tokens) {
        int rc = 0;
        for (const std::string& input : inputs) {
            if (dump_file_tokens(input) != 0) rc = 1;
        }
        return rc;
    }

    protodesc::Project project{};
    if (!include_dirs.empty()) project.set_search_paths(include_dirs);

    bool loaded = true;
    for (const std::string& input : inputs) {
        if (job_template)
            loaded &= project.add_job(input, std::string(*job_template), std::string(*job_suffix));
        else
            loaded &= project.add_proto(input);
    }

    const protodesc::Schema* schema = loaded ? project.resolve() : nullptr;
    if (!schema || project.has_errors()) {
        for (const auto& d : project.session().diags)
            std::cerr << protodesc::format_diagnostic(project.session().sources, d) << "\n";
        return 1;
    }

    if (dump_tree) {
        for (const protodesc::ProtoFile* f : schema->files())
            protodesc::dump_descriptors(std::cout, f);
    }

    protodesc::TemplateBuilder builder{*schema};
    if (dump_json) {
        protodesc::print_json(llvm::outs(), builder.files());
        llvm::outs() << "\n";
    }

    for (const protodesc::Job& job : schema->jobs()) {
        llvm::json::Object out{{"template", job.template_name},
                               {"suffix", job.suffix},
                               {"proto", job.path.string()},
                               {"data", builder.file(job.proto)}};
        protodesc::print_json(llvm::outs(), llvm::json::Value(std::move(out)));
        llvm::outs() << "\n";
    }
    llvm::outs().flush();
    return 0;
}
