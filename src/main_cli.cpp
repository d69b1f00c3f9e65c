#include "gw/commands.hpp"
#include "gw/log.hpp"
#include "gw/render.hpp"
#include "gw/serialization.hpp"
#include "gw/settings.hpp"
#include "gw/turn_manager.hpp"

#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliArgs {
  std::string settings_file;
  std::string load_file;
  std::string log_level;
  bool help{false};
};

CliArgs parse_args(int argc, char* argv[]){
  CliArgs a;
  for (int i = 1; i < argc; ++i){
    if (std::strcmp(argv[i], "--settings") == 0 && i + 1 < argc){
      a.settings_file = argv[++i];
    } else if (std::strcmp(argv[i], "--load") == 0 && i + 1 < argc){
      a.load_file = argv[++i];
    } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc){
      a.log_level = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0){
      a.help = true;
    } else {
      gw::logger()->warn("ignoring argument {}", argv[i]);
    }
  }
  return a;
}

const char* kHelp =
  "commands:\n"
  "  show                      board and players\n"
  "  build <type> <x> <y>      build phase: worker|scout|infantry|heavy\n"
  "  move <unit> <x> <y>       action phase\n"
  "  attack <unit> <x> <y>     action phase\n"
  "  gather <unit>             resource phase\n"
  "  targets <unit>            list what the unit can attack\n"
  "  next                      advance to the next phase\n"
  "  end                       end the turn now\n"
  "  pause | resume\n"
  "  surrender | draw\n"
  "  save <file> | load <file>\n"
  "  help | quit\n";

struct Session {
  gw::GameState       gs;
  gw::ResourceManager rm{gs};
  gw::TurnManager     tm;
  gw::CommandManager  cmds{gs};
  std::vector<gw::Subscription> subs;

  explicit Session(const gw::Settings& cfg) : tm(gs, rm, cfg){
    gs.set_player_name(1, cfg.player1_name);
    gs.set_player_name(2, cfg.player2_name);
    subs.push_back(gw::subscribe(gs.events(), "commandFailed", [](const gw::Event& e){
      std::cout << "  ! " << e.data.value("reason", std::string("rejected")) << "\n";
    }));
    subs.push_back(gw::subscribe(gs.events(), "phaseChanged", [](const gw::Event& e){
      std::cout << "  -- " << e.data["phase"].get<std::string>() << " phase\n";
    }));
    subs.push_back(gw::subscribe(gs.events(), "turnStarted", [this](const gw::Event& e){
      int p = e.data["player"].get<int>();
      std::cout << "== Turn " << e.data["turnNumber"].get<int>() << ": "
                << gs.player(p)->name << " ==\n";
    }));
    subs.push_back(gw::subscribe(gs.events(), "unitAttacked", [](const gw::Event& e){
      std::cout << "  hit for " << e.data["damage"].get<int>() << ", target health "
                << e.data["targetHealth"].get<int>()
                << (e.data["destroyed"].get<bool>() ? " (destroyed)" : "") << "\n";
    }));
    subs.push_back(gw::subscribe(gs.events(), "resourcesGathered", [](const gw::Event& e){
      std::cout << "  +" << e.data["amount"].get<int>() << " from "
                << e.data["nodeId"].get<std::string>() << "\n";
    }));
    subs.push_back(gw::subscribe(gs.events(), "turnTimeExpired", [](const gw::Event&){
      std::cout << "  time is up\n";
    }));
    subs.push_back(gw::subscribe(gs.events(), "gameEnded", [](const gw::Event& e){
      if (e.data["winner"].is_null()) std::cout << "*** draw ***\n";
      else std::cout << "*** player " << e.data["winner"].get<int>() << " wins ***\n";
    }));
  }
};

bool load_into(Session& s, const std::string& path){
  gw::ImportResult r = gw::load_from_file(path);
  if (!r.success){
    gw::logger()->error("load failed: {}", r.error);
    return false;
  }
  std::string why;
  if (!gw::deserialize(r.snapshot, s.gs, s.rm, &why)){
    gw::logger()->error("load failed: {}", why);
    return false;
  }
  s.tm.sync_from_state();
  return true;
}

void run_line(Session& s, const std::string& line, bool& quit){
  std::istringstream in(line);
  std::string cmd;
  if (!(in >> cmd)) return;

  if (cmd == "quit" || cmd == "exit"){
    quit = true;
  } else if (cmd == "help"){
    std::cout << kHelp;
  } else if (cmd == "show"){
    std::cout << gw::render_ascii(s.gs, s.rm) << gw::render_status(s.gs);
  } else if (cmd == "build"){
    std::string type; int x, y;
    if (!(in >> type >> x >> y)){ std::cout << "usage: build <type> <x> <y>\n"; return; }
    auto t = gw::parse_unit_type(type);
    if (!t){ std::cout << "unknown unit type " << type << "\n"; return; }
    s.cmds.execute(std::make_unique<gw::BuildCommand>(s.gs, *t, gw::Pos{x,y}, &s.tm));
  } else if (cmd == "move" || cmd == "attack"){
    gw::EntityId id; int x, y;
    if (!(in >> id >> x >> y)){ std::cout << "usage: " << cmd << " <unit> <x> <y>\n"; return; }
    if (cmd == "move") s.cmds.execute(std::make_unique<gw::MoveCommand>(s.gs, id, gw::Pos{x,y}, &s.tm));
    else               s.cmds.execute(std::make_unique<gw::AttackCommand>(s.gs, id, gw::Pos{x,y}, &s.tm));
  } else if (cmd == "gather"){
    gw::EntityId id;
    if (!(in >> id)){ std::cout << "usage: gather <unit>\n"; return; }
    s.cmds.execute(std::make_unique<gw::GatherCommand>(s.gs, s.rm, id, &s.tm));
  } else if (cmd == "targets"){
    gw::EntityId id;
    if (!(in >> id)){ std::cout << "usage: targets <unit>\n"; return; }
    for (auto& t: s.gs.valid_attack_targets(id))
      std::cout << "  " << gw::to_string(t.target_type) << " #" << t.target_id
                << " at (" << t.x << "," << t.y << ") for " << t.damage << "\n";
  } else if (cmd == "next"){
    if (!s.tm.next_phase()) std::cout << "cannot advance now\n";
  } else if (cmd == "end"){
    if (!s.tm.force_end_turn()) std::cout << "cannot end the turn now\n";
  } else if (cmd == "pause"){
    s.gs.pause_game();
  } else if (cmd == "resume"){
    s.gs.resume_game();
  } else if (cmd == "surrender"){
    s.gs.player_surrender(s.gs.current_player_id());
  } else if (cmd == "draw"){
    s.gs.declare_draw();
  } else if (cmd == "save"){
    std::string path;
    if (!(in >> path)){ std::cout << "usage: save <file>\n"; return; }
    if (!gw::save_to_file(path, s.gs, s.rm)) std::cout << "save failed\n";
  } else if (cmd == "load"){
    std::string path;
    if (!(in >> path)){ std::cout << "usage: load <file>\n"; return; }
    if (load_into(s, path)) std::cout << gw::render_ascii(s.gs, s.rm);
  } else {
    std::cout << "unknown command, try help\n";
  }
}

} // namespace

int main(int argc, char* argv[]){
  CliArgs args = parse_args(argc, argv);
  if (args.help){
    std::cout << "usage: gridwar_cli [--settings file.json] [--load save.json] [--log-level lvl]\n"
              << kHelp;
    return 0;
  }

  gw::Settings cfg;
  if (!args.settings_file.empty()){
    std::string err;
    cfg = gw::load_settings(args.settings_file, &err);
    if (!err.empty()) gw::logger()->error("Settings not loaded ({}), using defaults", err);
  }
  std::string level = args.log_level.empty() ? cfg.log_level : args.log_level;
  if (!gw::set_log_level(level)) gw::logger()->error("Invalid log level: {}", level);

  Session s(cfg);
  if (!args.load_file.empty()){
    if (!load_into(s, args.load_file)) return 1;
  } else {
    s.tm.start_game();
  }
  std::cout << gw::render_ascii(s.gs, s.rm) << gw::render_status(s.gs);

  // the turn timer follows the wall clock between inputs
  using clock = std::chrono::steady_clock;
  auto last = clock::now();
  bool quit = false;
  std::string line;
  while (!quit && !s.gs.ended()){
    std::cout << "P" << s.gs.current_player_id() << " " << gw::to_string(s.gs.current_phase())
              << " [" << s.tm.time_remaining_ms() / 1000 << "s]> " << std::flush;
    if (!std::getline(std::cin, line)) break;

    auto now = clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last).count();
    last = now;
    s.tm.advance_time(int(elapsed));
    if (s.gs.ended()) break;

    run_line(s, line, quit);
  }
  std::cout << gw::render_status(s.gs);
  return 0;
}
