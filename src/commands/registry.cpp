#include "commands/registry.hpp"
#include "commands/formatters.hpp"
#include "commands/parsers.hpp"
#include "core/verdi_session.hpp"

namespace lazyverdi::tui {

namespace {

Tab verdi_tab(VerdiSession& session, const std::string& name,
              std::vector<std::string> path, std::vector<std::string> args,
              Formatter formatter, TableParser parser) {
    std::string command_name;
    for (const auto& part : path) {
        command_name += command_name.empty() ? part : " " + part;
    }
    return Tab{
        .name = name,
        .command = CommandSpec::structured(command_name, session.verdi_invoker(std::move(path)),
                                           std::move(args)),
        .formatter = std::move(formatter),
        .parser = std::move(parser)
    };
}

} // namespace

std::vector<PanelDefinition> build_panel_registry(VerdiSession& session) {
    std::vector<PanelDefinition> panels;

    panels.push_back(PanelDefinition{
        .id = "panel-1", .label = "[1]", .kind = PanelKind::Table,
        .tabs = {
            verdi_tab(session, "computer", {"computer", "list"}, {"-r", "-a"},
                      format_table_output, parse_label_list),
            verdi_tab(session, "code", {"code", "list"}, {},
                      format_table_output, parse_table),
            verdi_tab(session, "plugin", {"plugin", "list"}, {},
                      format_table_output, parse_entry_point_list),
        }
    });

    panels.push_back(PanelDefinition{
        .id = "panel-2", .label = "[2]", .kind = PanelKind::Table,
        .tabs = {
            verdi_tab(session, "process", {"process", "list"}, {},
                      format_process_list, parse_table),
            verdi_tab(session, "calcjob", {"calcjob"}, {"--help"},
                      no_format, parse_subcommand_help),
        }
    });

    panels.push_back(PanelDefinition{
        .id = "panel-3", .label = "[3]", .kind = PanelKind::Table,
        .tabs = {
            verdi_tab(session, "group", {"group", "list"}, {},
                      format_table_output, parse_table),
            verdi_tab(session, "node", {"node", "list"}, {},
                      format_table_output, parse_table),
            Tab{
                .name = "restapi",
                .command = CommandSpec::structured("restapi server", session.rest_invoker("/server")),
                .formatter = {},
                .parser = parse_json_records
            },
        }
    });

    panels.push_back(PanelDefinition{
        .id = "panel-4", .label = "[4]", .kind = PanelKind::Text,
        .tabs = {
            verdi_tab(session, "config", {"config", "list"}, {},
                      format_status_output, {}),
            verdi_tab(session, "profile", {"profile", "list"}, {},
                      format_status_output, {}),
        }
    });

    panels.push_back(PanelDefinition{
        .id = "panel-5", .label = "[5]", .kind = PanelKind::Text,
        .tabs = {
            Tab{
                .name = "status",
                .command = CommandSpec::plain("status", [&session] { return session.status_report(); }),
                .formatter = no_format,
                .parser = {}
            },
            verdi_tab(session, "daemon", {"daemon", "status"}, {},
                      format_status_output, {}),
            verdi_tab(session, "storage", {"storage", "info"}, {},
                      format_status_output, {}),
        }
    });

    return panels;
}

} // namespace lazyverdi::tui
