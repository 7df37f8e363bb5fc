#include "pages_command.hpp"

#include <minirel/storage/page.hpp>
#include <minirel/storage/pager.hpp>

namespace minirel::cli {

void PagesCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Page file (.tbl or .idx)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("--page-size", page_size_, "Page size the file was written with")
        ->check(CLI::Range(MIN_PAGE_SIZE, MAX_PAGE_SIZE));
}

int PagesCommand::execute(CommandContext& ctx) {
    auto opened = Pager::open(file_, page_size_);
    if (!opened.ok()) {
        std::cerr << "Error: " << opened.error().to_string() << "\n";
        return MINIREL_EXIT_STORAGE_ERROR;
    }
    auto pager = std::move(opened).value();

    PageId count = pager->page_count();
    ctx.logger->debug("Reading " + std::to_string(count) + " pages from " + file_);
    std::cout << file_ << ": " << count << " pages of " << page_size_ << " bytes\n";

    Page page(page_size_);
    int exit_code = MINIREL_EXIT_SUCCESS;

    for (PageId id = 0; id < count; ++id) {
        auto read = pager->read_page(id, page.get_data());
        if (!read.ok()) {
            std::cerr << "Error: " << read.error().to_string() << "\n";
            return MINIREL_EXIT_STORAGE_ERROR;
        }
        page.set_page_id(id);

        std::cout << "  page " << id << ": ";
        switch (page.get_page_type()) {
            case PageType::UNFORMATTED:
                std::cout << "UNFORMATTED\n";
                break;
            case PageType::DATA: {
                DataPage data(&page);
                auto valid = data.check_format();
                if (!valid.ok()) {
                    std::cout << "DATA (invalid: " << valid.error().message() << ")\n";
                    exit_code = MINIREL_EXIT_STORAGE_ERROR;
                    break;
                }
                std::cout << "DATA slots=" << data.slot_count()
                          << " live=" << data.live_count()
                          << " free=" << data.free_space() << "\n";
                break;
            }
            case PageType::INDEX: {
                IndexPage index(&page);
                auto valid = index.check_format();
                if (!valid.ok()) {
                    std::cout << "INDEX (invalid: " << valid.error().message() << ")\n";
                    exit_code = MINIREL_EXIT_STORAGE_ERROR;
                    break;
                }
                std::cout << "INDEX entries=" << index.entry_count()
                          << " used=" << index.used_bytes()
                          << " free=" << index.free_space() << "\n";
                break;
            }
            default:
                std::cout << "UNKNOWN tag " << static_cast<int>(page.get_page_type()) << "\n";
                exit_code = MINIREL_EXIT_STORAGE_ERROR;
                break;
        }
    }

    return exit_code;
}

}  // namespace minirel::cli
