#include "internal/git/git.hpp"
#include "internal/stream/fast_export_parser.hpp"
#include "internal/stream/fast_import_writer.hpp"

#include <algorithm>
#include <dokuwiki/errors.hpp>
#include <dokuwiki/history_exporter.hpp>
#include <dokuwiki/log.hpp>
#include <dokuwiki/protocol/helper.hpp>
#include <dokuwiki/push_importer.hpp>
#include <limits>
#include <utility>

namespace dokuwiki
{
namespace protocol
{

namespace
{
bool starts_with(const std::string& text, const std::string& prefix)
{
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Author emails use the bare host name
std::string email_domain(const std::string& host)
{
    if (!host.empty() && host[0] == '[')
    {
        size_t close = host.find(']');
        return close == std::string::npos ? host : host.substr(1, close - 1);
    }
    return host.substr(0, host.find(':'));
}
} // namespace

ProtocolSession::ProtocolSession(std::istream& in, std::ostream& out, const RemoteOptions& options,
                                 WikiClient& client, IdentityMap& identities,
                                 BlobResolver resolve)
    : in_(in), out_(out), options_(options), client_(client), identities_(identities),
      mapper_(options.url.wiki_namespace, options.extension), resolve_(std::move(resolve))
{
    session_options_.depth = options.depth;
}

int ProtocolSession::run()
{
    std::string line;
    try
    {
        while (std::getline(in_, line))
        {
            if (line.empty())
                break;
            log::debug("command: " + line);

            if (line == "capabilities")
                capabilities();
            else if (line == "list")
                list(false);
            else if (line == "list for-push")
                list(true);
            else if (starts_with(line, "option "))
            {
                const std::string rest = line.substr(7);
                const size_t space = rest.find(' ');
                if (space == std::string::npos)
                    option(rest, std::string());
                else
                    option(rest.substr(0, space), rest.substr(space + 1));
            }
            else if (starts_with(line, "import "))
                import_batch(line.substr(7));
            else if (line == "export")
                export_stream();
            else
            {
                log::error("unknown command '" + line + "'");
                return EXIT_FAILED;
            }
        }
    }
    catch (const WikiError& e)
    {
        log::error(e.what());
        if (e.kind() == ErrorKind::Authentication)
            log::error("set DOKUWIKI_PASSWORD or configure a git credential helper for " +
                       options_.url.wiki_url);
        return EXIT_FAILED;
    }

    return fetch_failed_ ? EXIT_FAILED : EXIT_CLEAN;
}

// ============================================================================
// Commands
// ============================================================================

void ProtocolSession::capabilities()
{
    reply("import");
    reply("export");
    reply("refspec refs/heads/*:" + options_.private_namespace() + "*");
    reply("*import-marks " + identities_.marks_file());
    reply("*export-marks " + identities_.marks_file());
    reply("option");
    end_reply();
}

void ProtocolSession::list(bool for_push)
{
    const std::string ref = options_.branch_ref();
    identities_.reload_marks();
    const auto head = identities_.head(ref);

    if (!head && wiki_is_empty())
    {
        log::info("nothing to list: the wiki has no pages or media in scope");
        end_reply();
        return;
    }

    reply("@" + ref + " HEAD");
    std::optional<std::string> object;
    if (for_push && head)
        object = identities_.object_id(head->mark);
    reply((object ? *object : std::string("?")) + " " + ref);
    end_reply();
}

void ProtocolSession::option(const std::string& name, const std::string& value)
{
    auto invalid = [&]() { reply("error invalid value for " + name + ": '" + value + "'"); };

    if (name == "verbosity")
    {
        auto level = parse_integer(value);
        if (!level || *level < std::numeric_limits<int>::min() ||
            *level > std::numeric_limits<int>::max())
            return invalid();
        log::request_verbosity(static_cast<int>(*level));
        reply("ok");
    }
    else if (name == "depth")
    {
        auto depth = parse_integer(value);
        if (!depth || *depth < 1 || *depth > std::numeric_limits<int>::max())
            return invalid();
        session_options_.depth = static_cast<int>(*depth);
        reply("ok");
    }
    else if (name == "progress" || name == "dry-run" || name == "cloning")
    {
        auto flag = parse_boolean(value);
        if (!flag)
            return invalid();
        if (name == "progress")
            session_options_.progress = *flag;
        else if (name == "dry-run")
            session_options_.dry_run = *flag;
        else
            session_options_.cloning = *flag;
        reply("ok");
    }
    else
    {
        reply("unsupported");
    }
    out_.flush();
}

void ProtocolSession::import_batch(const std::string& first_ref)
{
    std::vector<std::string> refs{first_ref};
    std::string line;
    while (std::getline(in_, line) && !line.empty())
    {
        if (!starts_with(line, "import "))
        {
            log::error("unexpected command in import batch: '" + line + "'");
            fetch_failed_ = true;
            continue;
        }
        const std::string ref = line.substr(7);
        // HEAD resolves to the branch, which may already be requested
        if (std::find(refs.begin(), refs.end(), ref) == refs.end())
            refs.push_back(ref);
    }

    stream::FastImportWriter header;
    header.feature("done");
    header.feature("import-marks-if-exists=" + identities_.marks_file());
    header.feature("export-marks=" + identities_.marks_file());
    out_ << header.str();

    HistoryExporter exporter(client_, identities_, mapper_);
    std::vector<std::pair<ExportSettings, ExportResult>> completed;

    for (const auto& ref : refs)
    {
        if (ref != options_.branch_ref() && ref != "HEAD")
        {
            log::error("cannot fetch " + ref + ": the wiki only has " + options_.branch_ref());
            fetch_failed_ = true;
            continue;
        }
        if (!completed.empty())
            continue;

        ExportSettings settings;
        settings.head_key = options_.branch_ref();
        settings.target_ref = options_.private_ref();
        settings.depth = session_options_.depth;
        settings.progress = session_options_.progress;
        settings.email_domain = email_domain(options_.url.host);

        log::notice("Fetching " + ref + " from " + options_.url.wiki_url);
        try
        {
            ExportResult result = exporter.export_ref(settings);
            out_ << result.stream;
            out_.flush();
            completed.emplace_back(std::move(settings), std::move(result));
        }
        catch (const WikiError& e)
        {
            if (is_fatal(e.kind()))
                throw;
            log::error("fetching " + ref + " failed: " + e.what());
            fetch_failed_ = true;
        }
    }

    header.clear();
    header.done();
    out_ << header.str();
    out_.flush();

    for (const auto& [settings, result] : completed)
        exporter.record(settings, result);
}

void ProtocolSession::export_stream()
{
    identities_.reload_marks();
    stream::ExportStream input = stream::parse_fast_export(
        in_, [this](const std::string& dataref) { return resolve_blob(dataref); });
    log::debug("push stream: " + std::to_string(input.commits.size()) + " commit(s) for " +
               std::to_string(input.refs.size()) + " ref(s)");

    PushSettings settings;
    settings.branch_ref = options_.branch_ref();
    settings.strict = options_.strict_push;
    settings.dry_run = session_options_.dry_run;

    PushImporter importer(client_, identities_, mapper_);
    for (const auto& status : importer.push(input, settings))
    {
        if (status.ok)
            reply("ok " + status.ref);
        else
            reply("error " + status.ref + " " + status.reason);
    }
    end_reply();
}

// ============================================================================
// Helpers
// ============================================================================

std::string ProtocolSession::resolve_blob(const std::string& dataref) const
{
    if (resolve_)
        return resolve_(dataref);

    std::string object = dataref;
    if (starts_with(dataref, ":"))
    {
        auto mark = parse_integer(dataref.substr(1));
        if (!mark || *mark <= 0)
            throw StreamError("invalid data reference '" + dataref + "'");
        auto oid = identities_.object_id(static_cast<Mark>(*mark));
        if (!oid)
            throw StreamError("data reference " + dataref + " is not in " +
                              identities_.marks_file());
        object = *oid;
    }
    return git::cat_blob(object);
}

bool ProtocolSession::wiki_is_empty()
{
    const std::string& ns = mapper_.wiki_namespace();
    return client_.list_pages(ns).empty() && client_.list_media(ns).empty();
}

void ProtocolSession::reply(const std::string& line)
{
    log::debug("reply: " + line);
    out_ << line << '\n';
}

void ProtocolSession::end_reply()
{
    out_ << '\n';
    out_.flush();
}

} // namespace protocol
} // namespace dokuwiki
