//
// Tree printer
//

#include <riff/dump.hh>
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace riff {

    namespace {
        void dump_leaf(std::ostream& os, const leaf_chunk& leaf, const std::string& prefix,
                       const dump_options& options) {
            const auto length = leaf.declared_length();
            os << prefix << leaf.id() << " [8 + " << length;
            if (length & 1) {
                os << " + 1";
            }
            os << " bytes]";

            auto data = leaf.data();
            const std::size_t shown = std::min(options.preview_bytes, data.size());
            if (shown > 0) {
                auto flags = os.flags();
                auto fill = os.fill();
                os << std::hex << std::setfill('0');
                for (std::size_t i = 0; i < shown; i++) {
                    os << ' ' << std::setw(2) << std::to_integer<unsigned>(data[i]);
                }
                os.flags(flags);
                os.fill(fill);
                if (shown < data.size()) {
                    os << " ...";
                }
            }
            os << '\n';
        }

        void dump_chunk(std::ostream& os, const chunk& c, std::size_t level, const dump_options& options);

        void dump_container(std::ostream& os, const container_chunk& container, std::size_t level,
                            const dump_options& options) {
            const std::string prefix(level * options.indent, ' ');
            const std::string inner((level + 1) * options.indent, ' ');

            os << prefix << container.id() << " [8 + " << container.declared_length() << " bytes ("
               << container.count() << " subchunks)]\n";
            os << inner << container.type() << '\n';
            for (const auto& child : container) {
                dump_chunk(os, child, level + 1, options);
            }
        }

        void dump_chunk(std::ostream& os, const chunk& c, std::size_t level, const dump_options& options) {
            if (const auto* container = c.container()) {
                dump_container(os, *container, level, options);
            } else {
                const std::string prefix(level * options.indent, ' ');
                dump_leaf(os, c.as_leaf(), prefix, options);
            }
        }
    }

    void dump(std::ostream& os, const chunk& c, const dump_options& options) {
        dump_chunk(os, c, 0, options);
    }

    std::string to_string(const chunk& c, const dump_options& options) {
        std::ostringstream oss;
        dump(oss, c, options);
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        dump(os, c);
        return os;
    }

} // namespace riff
