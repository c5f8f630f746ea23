#include <gtest/gtest.h>
#include "pixsync_discovery.h"

TEST(Discovery, ServiceTypeLosesDomain) {
  EXPECT_EQ(discovery_service_type("_pixelcontroller-osc._udp"), "_pixelcontroller-osc._udp");
  EXPECT_EQ(discovery_service_type("_pixelcontroller-osc._udp.local"), "_pixelcontroller-osc._udp");
  EXPECT_EQ(discovery_service_type("_pixelcontroller-osc._udp.local."), "_pixelcontroller-osc._udp");
  EXPECT_EQ(discovery_service_type("_pixelcontroller-osc._udp."), "_pixelcontroller-osc._udp");
}

TEST(Discovery, EndpointPrefersResolvedAddress) {
  net_endpoint ep = discovery_endpoint("studio.local", "192.168.1.20", 9876);
  EXPECT_EQ(ep.host, "192.168.1.20");
  EXPECT_EQ(ep.port, 9876);

  ep = discovery_endpoint("studio.local", "", 9000);
  EXPECT_EQ(ep.host, "studio.local");
  EXPECT_EQ(ep.port, 9000);
}

TEST(Discovery, UnknownServiceTimesOut) {
  net_endpoint found{"unchanged", 1};
  sync_error err;
  EXPECT_FALSE(discover("_pixsync-none._udp", 300, &found, &err));
  EXPECT_EQ(err.code, sync_errc::DISCOVERY_TIMEOUT);
  EXPECT_FALSE(err.message.empty());
  EXPECT_EQ(found.host, "unchanged");
}

TEST(Discovery, IdleResponderStopsCleanly) {
  discovery_responder responder;
  EXPECT_FALSE(responder.is_running());
  EXPECT_FALSE(responder.established());
  EXPECT_TRUE(responder.instance_name().empty());
  responder.stop();
  responder.stop();
  EXPECT_FALSE(responder.is_running());
}
