#ifndef SPLATQUERY_QUERY_APP_HPP
#define SPLATQUERY_QUERY_APP_HPP

#include "types.hpp"
#include "geometry_buffer.hpp"
#include "octree.hpp"
#include <memory>
#include <string>
#include <vector>

namespace splatquery {

/// Outcome of one run, kept for callers that embed the app
struct QueryReport {
    PlyVariant variant = PlyVariant::Standard;
    size_t vertex_count = 0;
    size_t triangle_count = 0;
    int sh_degree = 0;
    BBox bounds;
    size_t inserted = 0;
    OctreeStats octree;
    Vec3f eye;
    Vec3f target;
    size_t visible_count = 0;
    std::vector<size_t> radius_counts;  // One per radius query, in order
};

class QueryApp {
public:
    QueryApp(int argc, char** argv);
    explicit QueryApp(const QueryConfig& config);
    void setLogCallback(LogCallback cb);
    void run();

    const QueryReport& report() const { return report_; }

private:
    void log(const std::string& msg);
    void parseArgs();
    void loadGeometry();
    void computeBoundsParallel();
    void buildOctree();
    void runFrustumQuery();
    void runRadiusQueries();
    void printUsage();

    int argc_;
    char** argv_;
    LogCallback log_cb_;

    QueryConfig config_;

    GeometryBuffer geometry_;
    std::unique_ptr<Octree> octree_;
    QueryReport report_;
};

} // namespace splatquery

#endif // SPLATQUERY_QUERY_APP_HPP
