#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <memory>
#include <string>

#include "routebroker/v1.hpp"

using namespace routebroker::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  routectl <addr> request <start_lat> <start_lon> <end_lat> <end_lon> [--force] [--start-name N] [--end-name N]\n"
            << "  routectl <addr> status <job_id>\n"
            << "  routectl <addr> cancel <job_id>\n"
            << "  routectl <addr> recent\n"
            << "  routectl <addr> evaluate <route.geojson>\n"
            << "  routectl <addr> import-meshes\n"
            << "  routectl <addr> meshes\n";
}

static bool ParseDouble(const char* text, double* out) {
  char* end = nullptr;
  *out      = std::strtod(text, &end);
  return end && end != text && *end == '\0';
}

static void PrintMessage(const google::protobuf::Message& message) {
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static int Report(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  PrintMessage(resp);
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto route_stub = RouteService::NewStub(channel);
  auto mesh_stub  = MeshAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "request") {
    if (argc < 7) {
      Usage();
      return 1;
    }

    double coords[4];
    for (int i = 0; i < 4; ++i) {
      if (!ParseDouble(argv[3 + i], &coords[i])) {
        std::cerr << "invalid coordinate: " << argv[3 + i] << "\n";
        return 1;
      }
    }

    RequestRouteRequest req;
    req.set_start_lat(coords[0]);
    req.set_start_lon(coords[1]);
    req.set_end_lat(coords[2]);
    req.set_end_lon(coords[3]);

    for (int i = 7; i < argc; ++i) {
      std::string flag = argv[i];
      if (flag == "--force") {
        req.set_force_recalculate(true);
      } else if (flag == "--start-name" && i + 1 < argc) {
        req.set_start_name(argv[++i]);
      } else if (flag == "--end-name" && i + 1 < argc) {
        req.set_end_name(argv[++i]);
      } else {
        std::cerr << "unknown option: " << flag << "\n";
        return 1;
      }
    }

    RequestRouteResponse resp;
    return Report(route_stub->RequestRoute(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 4) return 1;

    GetRouteStatusRequest req;
    req.set_id(argv[3]);

    RouteStatus resp;
    return Report(route_stub->GetRouteStatus(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelRouteRequest req;
    req.set_id(argv[3]);

    CancelRouteResponse resp;
    auto status = route_stub->CancelRoute(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "cancel requested\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "recent") {
    ListRecentRoutesResponse resp;
    return Report(route_stub->ListRecentRoutes(&ctx, ListRecentRoutesRequest{}, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "evaluate") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    std::stringstream text;
    text << in.rdbuf();

    EvaluateRouteRequest req;
    auto parsed = google::protobuf::util::JsonStringToMessage(text.str(), req.mutable_route());
    if (!parsed.ok()) {
      std::cerr << "invalid GeoJSON: " << parsed.message() << "\n";
      return 1;
    }

    EvaluateRouteResponse resp;
    return Report(route_stub->EvaluateRoute(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "import-meshes") {
    ImportMeshesResponse resp;
    auto status = mesh_stub->ImportMeshes(&ctx, ImportMeshesRequest{}, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& mesh : resp.added()) {
      std::cout << "added id=" << mesh.id() << " md5=" << mesh.md5() << " name=" << mesh.name() << "\n";
    }
    std::cout << resp.added_size() << " mesh(es) added\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "meshes") {
    ListMeshesResponse resp;
    auto status = mesh_stub->ListMeshes(&ctx, ListMeshesRequest{}, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& mesh : resp.meshes()) {
      std::cout << mesh.id() << "\t" << mesh.name() << "\tlat[" << mesh.bounds().lat_min() << "," << mesh.bounds().lat_max() << "] lon["
                << mesh.bounds().lon_min() << "," << mesh.bounds().lon_max() << "]\tsize=" << mesh.size() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
