#include "query_app.hpp"
#include "camera.hpp"
#include "frustum.hpp"
#include "ply_decoder.hpp"

#include <iostream>
#include <filesystem>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <omp.h>

namespace fs = std::filesystem;

namespace splatquery {

namespace {

std::string format_vec(const Vec3f& v) {
    return "(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ", " + std::to_string(v.z) + ")";
}

} // namespace

QueryApp::QueryApp(int argc, char** argv)
    : argc_(argc), argv_(argv) {}

QueryApp::QueryApp(const QueryConfig& config)
    : argc_(0), argv_(nullptr)
    , config_(config)
{
}

void QueryApp::setLogCallback(LogCallback cb) {
    log_cb_ = std::move(cb);
}

void QueryApp::log(const std::string& msg) {
    if (config_.quiet) {
        return;
    }
    if (log_cb_) {
        log_cb_(msg);
    } else {
        std::cout << msg;
    }
}

void QueryApp::run() {
    parseArgs();
    loadGeometry();
    computeBoundsParallel();
    buildOctree();
    runFrustumQuery();
    runRadiusQueries();

    log("\nDone.\n");
}

void QueryApp::printUsage() {
    std::cerr << "Usage: " << (argv_ ? argv_[0] : "splatquery") << " -i <input.ply> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --max-points N       Points per leaf before it splits (default: 100)\n"
              << "  --lod-factor F       LOD distance multiplier (default: 1000)\n"
              << "  --eye X,Y,Z          Camera position (default: framed from bounds)\n"
              << "  --target X,Y,Z       Camera target (default: bounds centre)\n"
              << "  --fov DEG            Vertical field of view (default: 60)\n"
              << "  --near D             Near plane (default: 0.1)\n"
              << "  --far D              Far plane (default: 10000)\n"
              << "  --aspect A           Viewport aspect ratio (default: 1.777)\n"
              << "  --radius X,Y,Z,R     Radius query, repeatable\n"
              << "  -q, --quiet          Suppress progress output\n";
}

void QueryApp::parseArgs() {
    for (int i = 1; i < argc_; ++i) {
        std::string arg = argv_[i];
        if (arg == "-i" && i + 1 < argc_) {
            config_.input_path = argv_[++i];
        } else if (arg == "--max-points" && i + 1 < argc_) {
            long n = std::strtol(argv_[++i], nullptr, 10);
            if (n <= 0) {
                throw std::runtime_error("--max-points must be a positive integer");
            }
            config_.octree.max_points_per_node = static_cast<size_t>(n);
        } else if (arg == "--lod-factor" && i + 1 < argc_) {
            if (sscanf(argv_[++i], "%f", &config_.octree.lod_factor) != 1) {
                throw std::runtime_error("Invalid lod-factor");
            }
        } else if (arg == "--eye" && i + 1 < argc_) {
            Vec3f& e = config_.eye;
            if (sscanf(argv_[++i], "%f,%f,%f", &e.x, &e.y, &e.z) != 3) {
                throw std::runtime_error("Invalid eye format. Use X,Y,Z");
            }
            config_.has_eye = true;
        } else if (arg == "--target" && i + 1 < argc_) {
            Vec3f& t = config_.target;
            if (sscanf(argv_[++i], "%f,%f,%f", &t.x, &t.y, &t.z) != 3) {
                throw std::runtime_error("Invalid target format. Use X,Y,Z");
            }
            config_.has_target = true;
        } else if (arg == "--fov" && i + 1 < argc_) {
            if (sscanf(argv_[++i], "%f", &config_.fov_y_degrees) != 1) {
                throw std::runtime_error("Invalid fov");
            }
        } else if (arg == "--near" && i + 1 < argc_) {
            if (sscanf(argv_[++i], "%f", &config_.near_plane) != 1) {
                throw std::runtime_error("Invalid near plane");
            }
        } else if (arg == "--far" && i + 1 < argc_) {
            if (sscanf(argv_[++i], "%f", &config_.far_plane) != 1) {
                throw std::runtime_error("Invalid far plane");
            }
        } else if (arg == "--aspect" && i + 1 < argc_) {
            if (sscanf(argv_[++i], "%f", &config_.aspect) != 1) {
                throw std::runtime_error("Invalid aspect");
            }
        } else if (arg == "--radius" && i + 1 < argc_) {
            RadiusQuery q;
            if (sscanf(argv_[++i], "%f,%f,%f,%f", &q.center.x, &q.center.y, &q.center.z, &q.radius) != 4) {
                throw std::runtime_error("Invalid radius format. Use X,Y,Z,R");
            }
            config_.radius_queries.push_back(q);
        } else if (arg == "-q" || arg == "--quiet") {
            config_.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            std::exit(EXIT_SUCCESS);
        }
    }

    if (config_.input_path.empty()) {
        printUsage();
        throw std::runtime_error("Missing required argument: -i");
    }

    if (!fs::exists(config_.input_path)) {
        throw std::runtime_error("Input file not found: " + config_.input_path);
    }

    if (!(config_.near_plane > 0.0f) || !(config_.far_plane > config_.near_plane)) {
        throw std::runtime_error("Near plane must be positive and below the far plane");
    }

    log("Input: " + config_.input_path + "\n");
}

void QueryApp::loadGeometry() {
    log("\nPhase 1: Decoding...\n");

    PlyDecoder decoder;
    decoder.set_diagnostic_callback([this](const Diagnostic& d) {
        log("Warning: " + d.message + "\n");
    });

    DecodeResult result = decoder.decode_file(config_.input_path);
    if (!result) {
        throw std::runtime_error("Failed to decode " + config_.input_path + ": " +
                                 to_string(result.error_kind()) + ": " + result.error());
    }
    geometry_ = result.take();

    report_.variant = geometry_.source_variant();
    report_.vertex_count = geometry_.vertex_count();
    report_.triangle_count = geometry_.triangle_count();
    report_.sh_degree = geometry_.sh_degree();

    log("  Layout: " + std::string(to_string(report_.variant)) + "\n");
    log("  " + std::to_string(report_.vertex_count) + " vertices, " +
        std::to_string(report_.triangle_count) + " triangles\n");
    log("  Channels:" + std::string(geometry_.has_normals() ? " normals" : "") +
        (geometry_.has_colors() ? " colors" : "") +
        (geometry_.has_scales() ? " scales" : "") +
        (geometry_.has_rotations() ? " rotations" : "") + "\n");
    log("  SH: " + (geometry_.has_sh() ? "degree " + std::to_string(report_.sh_degree) +
                    " (" + std::to_string(geometry_.sh_coefficients_per_vertex()) + " coefficients)"
                  : std::string("none")) + "\n");
}

void QueryApp::computeBoundsParallel() {
    int n_threads = omp_get_max_threads();
    std::vector<BBox> local_boxes(n_threads);
    const auto count = static_cast<ptrdiff_t>(geometry_.vertex_count());

    #pragma omp parallel
    {
        int tid = omp_get_thread_num();

        #pragma omp for schedule(static)
        for (ptrdiff_t i = 0; i < count; ++i) {
            local_boxes[tid].expand(geometry_.position(static_cast<size_t>(i)));
        }
    }

    // Sequential merge
    BBox bounds;
    for (int t = 0; t < n_threads; ++t) {
        bounds.expand(local_boxes[t]);
    }
    report_.bounds = bounds;

    log("  Bounds: " + format_vec(bounds.min) + " - " + format_vec(bounds.max) + "\n");
}

void QueryApp::buildOctree() {
    log("\nPhase 2: Building octree (max " + std::to_string(config_.octree.max_points_per_node) +
        " points per node)...\n");

    octree_ = std::make_unique<Octree>(Octree::from_bounds(report_.bounds, config_.octree));
    report_.inserted = octree_->insert_all(geometry_);
    report_.octree = octree_->stats();

    log("  " + std::to_string(report_.octree.node_count) + " nodes, " +
        std::to_string(report_.octree.leaf_count) + " leaves, depth " +
        std::to_string(report_.octree.depth) + "\n");
    if (report_.inserted != report_.vertex_count) {
        log("Warning: " + std::to_string(report_.vertex_count - report_.inserted) +
            " vertices fell outside the root cube\n");
    }
}

void QueryApp::runFrustumQuery() {
    CameraPose pose = camera_from_bounds(report_.bounds);
    if (config_.has_eye) pose.eye = config_.eye;
    if (config_.has_target) pose.target = config_.target;
    report_.eye = pose.eye;
    report_.target = pose.target;

    Eigen::Matrix4f view = look_at(pose.eye, pose.target);
    Eigen::Matrix4f projection = perspective(radians(config_.fov_y_degrees), config_.aspect,
                                             config_.near_plane, config_.far_plane);
    Frustum frustum;
    frustum.update(projection, view);

    std::vector<PointRef> visible = octree_->query_frustum(frustum, camera_position(view));
    report_.visible_count = visible.size();

    log("\nPhase 3: Frustum query\n");
    log("  Eye " + format_vec(pose.eye) + " -> target " + format_vec(pose.target) + "\n");
    log("  Visible: " + std::to_string(report_.visible_count) + " / " +
        std::to_string(report_.inserted) + " points\n");
}

void QueryApp::runRadiusQueries() {
    const auto& queries = config_.radius_queries;
    report_.radius_counts.assign(queries.size(), 0);
    if (queries.empty()) {
        return;
    }

    log("\nPhase 4: Radius queries (parallel, " + std::to_string(omp_get_max_threads()) + " threads)...\n");

    const Octree& tree = *octree_;
    const auto query_count = static_cast<ptrdiff_t>(queries.size());

    #pragma omp parallel for schedule(dynamic)
    for (ptrdiff_t i = 0; i < query_count; ++i) {
        const RadiusQuery& q = queries[static_cast<size_t>(i)];
        report_.radius_counts[static_cast<size_t>(i)] = tree.query_radius(q.center, q.radius).size();
    }

    for (size_t i = 0; i < queries.size(); ++i) {
        log("  " + format_vec(queries[i].center) + " r=" + std::to_string(queries[i].radius) +
            ": " + std::to_string(report_.radius_counts[i]) + " points\n");
    }
}

} // namespace splatquery
