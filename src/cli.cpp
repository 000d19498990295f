#include "cli.hpp"
#include "boundary.hpp"
#include "hostruntime.hpp"
#include "identifier.hpp"
#include "idmill.h"
#include "nativehost.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace idmill::cli {

namespace {

void printUsage(std::ostream& err)
{
    err << "Usage: idmill <account_id|component_id|symbol|venue> <value>..." << std::endl;
}

template <typename Tag>
std::vector<std::string> inspectKind(const std::vector<std::string>& values)
{
    std::vector<std::string> lines;
    std::vector<Identifier<Tag>> seen;
    seen.reserve(values.size());

    for (const auto& value : values) {
        HostTextPtr inbound(NativeHost::create(value));
        Identifier<Tag> id = boundary::fromLayout<Tag>(boundary::fromForeignText<Tag>(inbound.get()));
        inbound.reset();

        HostTextPtr outbound(HostRuntime::instance().newText(id.value()));
        bool intact = NativeHost::text(outbound.get()) == value;

        std::ostringstream line;
        line << id.repr() << " hash=" << id.hash();
        if (!intact) {
            line << " [round trip altered text]";
        }
        for (size_t i = 0; i < seen.size(); ++i) {
            if (seen[i] == id) {
                line << " (same as #" << i + 1 << ")";
                break;
            }
        }
        lines.push_back(line.str());
        seen.push_back(std::move(id));
    }
    return lines;
}

} // namespace

std::vector<std::string> inspect(const std::string& kind, const std::vector<std::string>& values)
{
    if (values.empty()) {
        throw std::invalid_argument("Expected at least one value");
    }

    if (kind == "account_id") {
        return inspectKind<AccountIdTag>(values);
    }
    if (kind == "component_id") {
        return inspectKind<ComponentIdTag>(values);
    }
    if (kind == "symbol") {
        return inspectKind<SymbolTag>(values);
    }
    if (kind == "venue") {
        return inspectKind<VenueTag>(values);
    }
    throw std::invalid_argument("Unknown identifier kind: " + kind);
}

int run(int argc, char* argv[], std::ostream& out, std::ostream& err)
{
    try {
        if (argc < 3) {
            printUsage(err);
            throw std::invalid_argument("Expected a kind and at least one value");
        }

        std::string kind = argv[1];
        std::vector<std::string> values(argv + 2, argv + argc);

        idmill_host_api api = NativeHost::api();
        if (idmill_install_host(&api) == 0) {
            throw std::runtime_error("Failed to install native host");
        }

        out << "Inspecting " << values.size() << " " << kind << " value(s)" << std::endl;

        std::vector<std::string> lines;
        try {
            lines = inspect(kind, values);
        } catch (const std::invalid_argument&) {
            printUsage(err);
            throw;
        }
        for (const auto& line : lines) {
            out << line << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        err << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace idmill::cli
