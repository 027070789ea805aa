/**
 * @file main.cpp
 * @brief layoutview entry: builds a synthetic architecture graph, lays it out on the simulation thread and draws
 *        each received snapshot with ncurses.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "LayoutController.h"
#include "Logger.h"

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

// Forward decl for signal handler
static void init_colors_layout();

static bool g_curses_inited = false;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Suspend: restore tty, then stop process with default action
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{}; sa.sa_handler = SIG_DFL; sigemptyset(&sa.sa_mask); sa.sa_flags = 0; sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume: restore curses state and redraw
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    refresh();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors_layout();
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
    g_needs_full_redraw = 1;
}

static constexpr int GroupColors = 6;

static void init_colors_layout() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    // 1: links, 2..7: one pair per group (cycled)
    init_pair(1, COLOR_BLUE, -1);
    init_pair(2, COLOR_RED, -1);
    init_pair(3, COLOR_GREEN, -1);
    init_pair(4, COLOR_YELLOW, -1);
    init_pair(5, COLOR_MAGENTA, -1);
    init_pair(6, COLOR_CYAN, -1);
    init_pair(7, COLOR_WHITE, -1);
}

static bool parseFloat(const char* s, float& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || errno != 0) return false;
    out = static_cast<float>(v);
    return true;
}

static bool parseInt(const char* s, int& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || errno != 0) return false;
    out = static_cast<int>(v);
    return true;
}

/** @brief Viewer settings gathered from LAYOUT_* environment variables, then overridden by arguments. */
struct ViewerOptions {
    int majors{6};
    int seed{7};
    int intervalMs{16};
    LayoutConfigPatch patch;
};

static void applyOption(const std::string& key, const char* v, ViewerOptions& o) {
    float f;
    int i;
    if (key == "nodes") { if (parseInt(v, i)) o.majors = i; }
    else if (key == "seed") { if (parseInt(v, i)) o.seed = i; }
    else if (key == "interval") { if (parseInt(v, i)) o.intervalMs = i; }
    else if (key == "snapshot-every") { if (parseInt(v, i)) o.patch.snapshotEvery = i; }
    else if (key == "alpha-decay") { if (parseFloat(v, f)) o.patch.alphaDecay = f; }
    else if (key == "velocity-decay") { if (parseFloat(v, f)) o.patch.velocityDecay = f; }
    else if (key == "padding") { if (parseFloat(v, f)) o.patch.collisionPadding = f; }
}

static ViewerOptions readOptions(int argc, char** argv) {
    ViewerOptions o;
    static const char* keys[] = { "nodes", "seed", "interval", "snapshot-every", "alpha-decay", "velocity-decay", "padding" };
    // Env overrides: LAYOUT_NODES, LAYOUT_ALPHA_DECAY, ...
    for (const char* k : keys) {
        std::string env = "LAYOUT_";
        for (const char* p = k; *p; ++p) env += (*p == '-') ? '_' : (char)std::toupper((unsigned char)*p);
        applyOption(k, std::getenv(env.c_str()), o);
    }
    // Arg overrides: --key value or --key=value
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind("--", 0) != 0) continue;
        std::string key = a.substr(2);
        size_t eq = key.find('=');
        if (eq != std::string::npos) {
            applyOption(key.substr(0, eq), a.c_str() + 2 + eq + 1, o);
        } else if (i + 1 < argc) {
            applyOption(key, argv[++i], o);
        }
    }
    // Validation/clamping
    if (o.majors < 1) o.majors = 1;
    if (o.majors > 40) o.majors = 40;
    if (o.intervalMs < 0) o.intervalMs = 16;
    return o;
}

/**
 * @brief Synthetic architecture map: a ring of major modules joined by orchestrator links, each with a few minor
 *        sub-features, plus overlap links between sub-features of different modules.
 */
static void buildSampleGraph(int majors, int seed, std::vector<GraphNode>& nodes, std::vector<GraphLink>& links,
                             std::vector<int>& groupOf) {
    std::mt19937 gen((unsigned)seed);
    std::uniform_int_distribution<int> minorCount(2, 5);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::vector<size_t> minors;
    for (int m = 0; m < majors; ++m) {
        std::string group = std::string(1, (char)('A' + (m % 26)));
        GraphNode major;
        major.id = "mod-" + std::to_string(m);
        major.kind = NodeKind::Major;
        major.group = group;
        major.radius = 40.0;
        nodes.push_back(major);
        groupOf.push_back(m);
        if (m > 0) links.push_back({"mod-" + std::to_string(m - 1), major.id, LinkKind::Orchestrator});
        int count = minorCount(gen);
        for (int k = 0; k < count; ++k) {
            GraphNode minor;
            minor.id = major.id + "/feat-" + std::to_string(k);
            minor.kind = NodeKind::Minor;
            minor.group = group;
            minor.radius = 14.0;
            minors.push_back(nodes.size());
            nodes.push_back(minor);
            groupOf.push_back(m);
            links.push_back({major.id, minor.id, LinkKind::Subfeature});
        }
    }
    if (majors > 2) links.push_back({"mod-" + std::to_string(majors - 1), "mod-0", LinkKind::Orchestrator});
    for (size_t a = 0; a < minors.size(); ++a) {
        for (size_t b = a + 1; b < minors.size(); ++b) {
            const GraphNode& na = nodes[minors[a]];
            const GraphNode& nb = nodes[minors[b]];
            if (na.group != nb.group && coin(gen) < 0.04) links.push_back({na.id, nb.id, LinkKind::Overlap});
        }
    }
}

/** @brief Maps layout coordinates into the drawable area, fitted to the current snapshot's bounds. */
struct Viewport {
    double minx{0}, miny{0}, scale{1};
    int w{1}, h{1};

    void fit(const PositionBuffer& pos, int width, int height) {
        w = width; h = height;
        if (pos.empty()) return;
        double maxx = pos.x(0), maxy = pos.y(0);
        minx = maxx; miny = maxy;
        for (size_t i = 1; i < pos.nodeCount(); ++i) {
            minx = std::min(minx, pos.x(i)); maxx = std::max(maxx, pos.x(i));
            miny = std::min(miny, pos.y(i)); maxy = std::max(maxy, pos.y(i));
        }
        // Terminal cells are about twice as tall as they are wide.
        double sx = (maxx - minx) > 0 ? (double)(w - 3) / (maxx - minx) : 1.0;
        double sy = (maxy - miny) > 0 ? (double)(h - 3) * 2.0 / (maxy - miny) : 1.0;
        scale = std::min(sx, sy);
    }
    int col(double x) const { return 1 + (int)std::lround((x - minx) * scale); }
    int row(double y) const { return 1 + (int)std::lround((y - miny) * scale * 0.5); }
    bool inside(int c, int r) const { return c >= 0 && r >= 0 && c < w && r < h; }
};

static void drawLine(const Viewport& vp, int c0, int r0, int c1, int r1) {
    int dc = std::abs(c1 - c0), dr = -std::abs(r1 - r0);
    int sc = c0 < c1 ? 1 : -1, sr = r0 < r1 ? 1 : -1;
    int err = dc + dr;
    for (;;) {
        if (vp.inside(c0, r0)) mvaddch(r0, c0, '.');
        if (c0 == c1 && r0 == r1) break;
        int e2 = 2 * err;
        if (e2 >= dr) { err += dr; c0 += sc; }
        if (e2 <= dc) { err += dc; r0 += sr; }
    }
}

static void drawGraph(const PositionBuffer& pos, const std::vector<GraphNode>& nodes,
                      const std::vector<std::pair<size_t, size_t>>& edges, const std::vector<int>& groupOf,
                      int gridW, int gridH) {
    erase();
    if (pos.nodeCount() != nodes.size()) return;
    Viewport vp;
    vp.fit(pos, gridW, gridH);
    attron(COLOR_PAIR(1));
    for (auto& e : edges) {
        drawLine(vp, vp.col(pos.x(e.first)), vp.row(pos.y(e.first)), vp.col(pos.x(e.second)), vp.row(pos.y(e.second)));
    }
    attroff(COLOR_PAIR(1));
    for (size_t i = 0; i < nodes.size(); ++i) {
        int c = vp.col(pos.x(i)), r = vp.row(pos.y(i));
        if (!vp.inside(c, r)) continue;
        int pair = 2 + (groupOf[i] % GroupColors);
        char sym = nodes[i].group.empty() ? '?' : nodes[i].group[0];
        bool major = nodes[i].kind == NodeKind::Major;
        if (!major) sym = (char)std::tolower((unsigned char)sym);
        if (major) attron(A_BOLD);
        attron(COLOR_PAIR(pair));
        mvaddch(r, c, sym);
        attroff(COLOR_PAIR(pair));
        if (major) attroff(A_BOLD);
    }
}

static void drawStatusLine(const LayoutController& ctl, size_t nodeCount, size_t linkCount, bool stopped,
                           bool pinned, double alphaTarget, double repulsionScale) {
    int rows, cols; getmaxyx(stdscr, rows, cols);
    int y = rows - 1;
    move(y, 0); clrtoeol();
    const char* state = stopped ? "STOPPED" : (ctl.settled() ? "SETTLED" : "RUNNING");
    char status[256];
    snprintf(status, sizeof(status),
             "[s]top/restart [r]eheat [p]in [t]arget [-/+]repulsion [q]uit | nodes:%zu links:%zu alpha:%.4f target:%.2f rep:x%.2f ticks:%llu %s%s",
             nodeCount, linkCount, ctl.lastAlpha().value_or(1.0), alphaTarget, repulsionScale,
             (unsigned long long)ctl.ticksReceived(), state, pinned ? " PIN0" : "");
    mvprintw(y, 0, "%.*s", cols, status);
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "layoutview");
    Logger::info("layoutview starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (layoutview)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (layoutview)"); }
            } else {
                Logger::error("std::terminate (layoutview): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    ViewerOptions opts = readOptions(argc, argv);

    std::vector<GraphNode> nodes;
    std::vector<GraphLink> links;
    std::vector<int> groupOf;
    buildSampleGraph(opts.majors, opts.seed, nodes, links, groupOf);
    std::vector<std::pair<size_t, size_t>> edges;
    {
        std::unordered_map<std::string, size_t> idx;
        for (size_t i = 0; i < nodes.size(); ++i) idx[nodes[i].id] = i;
        for (auto& l : links) edges.emplace_back(idx[l.sourceId], idx[l.targetId]);
    }
    LayoutConfig config = LayoutConfig::defaults();
    config.merge(opts.patch);
    config = config.validated();
    Logger::info("layoutview graph: nodes=" + std::to_string(nodes.size()) + " links=" + std::to_string(links.size()) +
                 " " + config.describe());

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    init_colors_layout();

    int rows, cols; getmaxyx(stdscr, rows, cols);
    int gridH = rows - 1;
    int gridW = cols;
    if (gridH < 3 || gridW < 3) { Logger::error("terminal too small"); endwin(); g_curses_inited = false; Logger::shutdown(); return 1; }

    LayoutWorker::Options wopts;
    wopts.iterationIntervalMs = opts.intervalMs;
    LayoutController ctl(wopts);
    bool frameDirty = false;
    ctl.onTick([&](const PositionBuffer&, std::optional<double>) { frameDirty = true; });
    ctl.onSettled([&](double a) { Logger::info("layout settled: alpha=" + std::to_string(a)); });
    ctl.init(nodes, links, config);

    bool done = false;
    bool stopped = false;
    bool pinned = false;
    double alphaTarget = 0.0;
    double repulsionScale = 1.0;
    while (!done) {
        if (g_stop) done = true;
        ctl.poll();
        if (g_needs_full_redraw) {
            getmaxyx(stdscr, rows, cols);
            gridH = std::max(3, rows - 1); gridW = std::max(3, cols);
            g_needs_full_redraw = 0;
            frameDirty = true;
        }
        if (frameDirty && ctl.hasPositions()) {
            drawGraph(ctl.positions(), nodes, edges, groupOf, gridW, gridH);
            frameDirty = false;
        }
        drawStatusLine(ctl, nodes.size(), links.size(), stopped, pinned, alphaTarget, repulsionScale);
        refresh();
        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; break;
            case 's': case 'S':
                if (stopped) ctl.restart(); else ctl.stop();
                stopped = !stopped;
                Logger::info(std::string("stopped = ") + (stopped ? "true" : "false"));
                break;
            case 'r': case 'R':
                // reheat only wakes a settled session; a stopped one needs restart
                if (stopped) { ctl.restart(); stopped = false; } else ctl.reheat(0.3);
                Logger::info("reheat"); break;
            case 'p': case 'P':
                if (pinned) ctl.unpinNode(nodes[0].id); else ctl.pinNode(0, 0.0, 0.0);
                pinned = !pinned;
                if (!stopped) ctl.reheat(0.3);
                Logger::info(std::string("node 0 pinned = ") + (pinned ? "true" : "false"));
                break;
            case 't': case 'T':
                alphaTarget = (alphaTarget > 0.0) ? 0.0 : 0.3;
                ctl.setAlphaTarget(alphaTarget);
                if (alphaTarget > 0.0 && !stopped) ctl.restart();
                Logger::info("alphaTarget set: " + std::to_string(alphaTarget));
                break;
            case '+': case '-': {
                repulsionScale *= (ch == '+') ? 1.25 : 0.8;
                LayoutConfigPatch p;
                p.setRepulsion(NodeKind::Major, config.repulsionFor(NodeKind::Major) * repulsionScale);
                p.setRepulsion(NodeKind::Minor, config.repulsionFor(NodeKind::Minor) * repulsionScale);
                ctl.updateConfig(p);
                if (!stopped) ctl.reheat(0.3);
                Logger::info("repulsion scale: " + std::to_string(repulsionScale));
                break;
            }
            case KEY_RESIZE:
                g_needs_full_redraw = 1; break;
            default:
                break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    endwin();
    g_curses_inited = false;
    Logger::info("layoutview terminating");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (layoutview)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (layoutview)");
        Logger::shutdown();
        return 2;
    }
}
