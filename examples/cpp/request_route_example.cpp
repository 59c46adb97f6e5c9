#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <iostream>
#include <string>

#include "client/cpp/route_broker_client.h"
#include "routebroker/v1.hpp"

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  routebroker::client::RouteBrokerClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Rothera to Halley; both ends must lie inside an imported mesh.
  routebroker::client::RouteBrokerClient::RouteRequest request;
  request.start_lat  = -67.57;
  request.start_lon  = -68.13;
  request.end_lat    = -75.58;
  request.end_lon    = -26.66;
  request.start_name = "Rothera";
  request.end_name   = "Halley";

  auto submitted = client.RequestRoute(request);
  if (!submitted.ok()) {
    std::cerr << "RequestRoute failed: " << submitted.status().ToString() << "\n";
    return 1;
  }

  if (submitted->id().empty()) {
    std::cerr << "no route: " << submitted->error() << "\n";
    return 1;
  }

  if (submitted->existing()) {
    std::cout << submitted->info() << "\n";
  }
  std::cout << "job " << submitted->id() << " (" << submitted->status_url() << ")\n";

  auto finished = client.WaitForRoute(submitted->id(), std::chrono::milliseconds(500), std::chrono::minutes(10));
  if (!finished.ok()) {
    std::cerr << finished.status().ToString() << "\n";
    return 1;
  }

  std::cout << "status: " << routebroker::v1::JobState_Name(finished->status()) << "\n";
  if (finished->status() == routebroker::v1::JOB_STATE_FAILURE) {
    std::cerr << "error: " << finished->error() << "\n";
    return 1;
  }

  const auto& fields = finished->route().json().fields();
  auto        it     = fields.find("features");
  std::cout << "features: " << (it == fields.end() ? 0 : it->second.list_value().values_size()) << "\n";
  return 0;
}
