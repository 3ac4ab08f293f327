#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

#include "application/services/decode/BaselineDecoders.hpp"
#include "application/services/decode/LinkTypeRegistry.hpp"
#include "application/services/decode/Packet.hpp"
#include "support/TestDecoders.hpp"

using namespace strata::testing;
namespace dec = strata::application::services::decode;
using dec::DecodeState;
using dec::Packet;
using strata::domain::DecodeMode;
using strata::domain::LinkType;
using strata::domain::layers::DecodeFailureType;
using strata::domain::layers::Layer;
using strata::domain::layers::PayloadType;

namespace
{
constexpr LayerType kLink{100};
constexpr LayerType kNet{101};
constexpr LayerType kTrans{102};
constexpr LinkType kStubLink = static_cast<LinkType>(200);

class PacketTest : public ::testing::Test
{
 protected:
  PacketTest()
  {
    registry.register_decoder(kStubLink, link);
    registry.register_decoder(LinkType::Raw, dec::PayloadDecoder());
  }

  StubDecoder trans{kTrans, 4, Slot::Transport, &dec::PayloadDecoder()};
  StubDecoder net{kNet, 4, Slot::Network, &trans};
  StubDecoder link{kLink, 4, Slot::Link, &net};
  dec::LinkTypeRegistry registry;
};

// Position of `l` in the packet's chain, or -1.
long index_of(const Packet& p, const Layer* l)
{
  if (l == nullptr) return -1;
  const auto& chain = p.layers();
  for (std::size_t i = 0; i < chain.size(); ++i)
    if (chain[i].get() == l) return static_cast<long>(i);
  return -2;
}

void expect_same_decode(const Packet& a, const Packet& b)
{
  const auto& ca = a.layers();
  const auto& cb = b.layers();
  ASSERT_EQ(ca.size(), cb.size());
  for (std::size_t i = 0; i < ca.size(); ++i)
  {
    EXPECT_EQ(ca[i]->type(), cb[i]->type()) << "layer " << i;
    auto pa = ca[i]->payload();
    auto pb = cb[i]->payload();
    EXPECT_TRUE(std::equal(pa.begin(), pa.end(), pb.begin(), pb.end())) << "layer " << i;
  }
  EXPECT_EQ(index_of(a, a.link_layer()), index_of(b, b.link_layer()));
  EXPECT_EQ(index_of(a, a.network_layer()), index_of(b, b.network_layer()));
  EXPECT_EQ(index_of(a, a.transport_layer()), index_of(b, b.transport_layer()));
  EXPECT_EQ(index_of(a, a.application_layer()), index_of(b, b.application_layer()));
  EXPECT_EQ(index_of(a, a.error_layer()), index_of(b, b.error_layer()));
}
}  // namespace

TEST_F(PacketTest, EagerDecodesInConstructor)
{
  Packet p{pattern(20), kStubLink, DecodeMode::Eager, registry};

  EXPECT_EQ(p.state(), DecodeState::FullyDecoded);
  EXPECT_EQ(link.calls(), 1);
  EXPECT_EQ(net.calls(), 1);
  EXPECT_EQ(trans.calls(), 1);
  EXPECT_EQ(p.layers().size(), 4u);
}

TEST_F(PacketTest, LazyStartsUnstarted)
{
  Packet p{pattern(20), kStubLink, DecodeMode::Lazy, registry};

  EXPECT_EQ(p.state(), DecodeState::Unstarted);
  EXPECT_EQ(link.calls(), 0);
  EXPECT_EQ(p.data().size(), 20u);
  EXPECT_EQ(p.state(), DecodeState::Unstarted);
}

TEST_F(PacketTest, LazyDecodesOnlyAsFarAsNeeded)
{
  Packet p{pattern(20), kStubLink, DecodeMode::Lazy, registry};

  const Layer* network = p.network_layer();
  ASSERT_NE(network, nullptr);
  EXPECT_EQ(network->type(), kNet);
  EXPECT_EQ(p.state(), DecodeState::PartiallyDecoded);
  EXPECT_EQ(link.calls(), 1);
  EXPECT_EQ(net.calls(), 1);
  EXPECT_EQ(trans.calls(), 0);

  // link was decoded on the way, no further step needed
  EXPECT_EQ(p.link_layer()->type(), kLink);
  EXPECT_EQ(trans.calls(), 0);
}

TEST_F(PacketTest, LazyReaccessDoesNotRedecode)
{
  Packet p{pattern(20), kStubLink, DecodeMode::Lazy, registry};

  const Layer* first = p.transport_layer();
  const Layer* second = p.transport_layer();
  EXPECT_EQ(first, second);
  EXPECT_EQ(link.calls(), 1);
  EXPECT_EQ(net.calls(), 1);
  EXPECT_EQ(trans.calls(), 1);

  const auto& all = p.layers();
  const auto& again = p.layers();
  EXPECT_EQ(&all, &again);
  EXPECT_EQ(all.size(), 4u);
  EXPECT_EQ(trans.calls(), 1);
  EXPECT_EQ(p.state(), DecodeState::FullyDecoded);
}

TEST_F(PacketTest, LayerByTypeStopsAtFirstMatch)
{
  Packet p{pattern(20), kStubLink, DecodeMode::Lazy, registry};

  const Layer* l = p.layer(kNet);
  ASSERT_NE(l, nullptr);
  EXPECT_EQ(l->type(), kNet);
  EXPECT_EQ(trans.calls(), 0);

  EXPECT_EQ(p.layer(LayerType{4000}), nullptr);
  EXPECT_EQ(p.state(), DecodeState::FullyDecoded);
}

TEST_F(PacketTest, ModesProduceIdenticalChains)
{
  const std::vector<std::vector<std::byte>> inputs = {
      pattern(20), pattern(12), pattern(13), pattern(9), pattern(3), {}};

  for (const auto& in : inputs)
  {
    for (LinkType lt : {kStubLink, LinkType::Raw, LinkType::Ethernet})
    {
      SCOPED_TRACE(::testing::Message() << "size " << in.size() << " linktype "
                                        << strata::domain::to_underlying(lt));
      Packet eager{in, lt, DecodeMode::Eager, registry};
      Packet lazy{in, lt, DecodeMode::Lazy, registry};
      expect_same_decode(eager, lazy);
    }
  }
}

TEST_F(PacketTest, LazyPartialAccessThenFullMatchesEager)
{
  Packet eager{pattern(20), kStubLink, DecodeMode::Eager, registry};
  Packet lazy{pattern(20), kStubLink, DecodeMode::Lazy, registry};

  ASSERT_NE(lazy.link_layer(), nullptr);
  expect_same_decode(eager, lazy);
}

TEST_F(PacketTest, UnknownLinkTypeYieldsSingleErrorLayer)
{
  Packet p{pattern(8), static_cast<LinkType>(9999), DecodeMode::Lazy, registry};

  const auto& chain = p.layers();
  ASSERT_EQ(chain.size(), 1u);
  EXPECT_EQ(chain[0]->type(), DecodeFailureType);

  const auto* err = p.error_layer();
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->error().cause, dec::kUnsupportedLinkType);
  EXPECT_EQ(p.link_layer(), nullptr);
  EXPECT_EQ(p.application_layer(), nullptr);
  EXPECT_EQ(p.state(), DecodeState::FullyDecoded);
}

TEST_F(PacketTest, TruncatedInnerLayerKeepsOuterSlots)
{
  // 10 bytes: link(4) + net(4) + 2 bytes too short for transport
  Packet p{pattern(10), kStubLink, DecodeMode::Eager, registry};

  ASSERT_NE(p.network_layer(), nullptr);
  EXPECT_EQ(p.transport_layer(), nullptr);
  ASSERT_NE(p.error_layer(), nullptr);
  EXPECT_EQ(p.error_layer()->error().cause, "truncated stub header");
  EXPECT_EQ(p.layers().size(), 3u);
  EXPECT_EQ(p.layers().back().get(), p.error_layer());
}

TEST_F(PacketTest, SlotsSurviveMove)
{
  Packet p{pattern(20), kStubLink, DecodeMode::Lazy, registry};
  const Layer* link_before = p.link_layer();
  const auto* data_before = p.data().data();

  Packet moved = std::move(p);
  EXPECT_EQ(moved.link_layer(), link_before);
  EXPECT_EQ(moved.data().data(), data_before);
  EXPECT_EQ(moved.application_layer()->payload().data(), data_before + 12);
}

TEST_F(PacketTest, CopiesCallerBytes)
{
  auto in = pattern(20);
  Packet p{std::span<const std::byte>(in), kStubLink, DecodeMode::Eager, registry};
  in.assign(in.size(), std::byte{0xFF});

  EXPECT_EQ(p.data()[0], std::byte{0x00});
  EXPECT_EQ(p.application_layer()->payload()[0], std::byte{12});
}

TEST_F(PacketTest, StepCeilingFromOptions)
{
  LoopingDecoder loop;
  registry.register_decoder(kStubLink, loop);
  Packet p{pattern(4), kStubLink, DecodeMode::Eager, registry, dec::PacketOptions{3}};

  EXPECT_EQ(loop.calls(), 3);
  ASSERT_NE(p.error_layer(), nullptr);
  EXPECT_EQ(p.error_layer()->error().cause, dec::kStepLimitExceeded);
}

TEST_F(PacketTest, DescribeListsEveryLayer)
{
  Packet p{pattern(10), kStubLink, DecodeMode::Lazy, registry};
  const std::string text = p.describe();

  EXPECT_NE(text.find("PACKET: 10 bytes"), std::string::npos);
  EXPECT_NE(text.find("3 layer(s)"), std::string::npos);
  EXPECT_NE(text.find("- Layer 3: DecodeFailure"), std::string::npos);
  EXPECT_NE(text.find("(truncated stub header)"), std::string::npos);
}

TEST_F(PacketTest, EagerPacketReadableFromManyThreads)
{
  const Packet p{pattern(20), kStubLink, DecodeMode::Eager, registry};
  const Layer* app = p.application_layer();

  std::vector<std::thread> readers;
  std::vector<int> ok(4, 0);
  for (int t = 0; t < 4; ++t)
  {
    readers.emplace_back(
        [&, t]
        {
          for (int i = 0; i < 1000; ++i)
          {
            if (p.application_layer() == app && p.layers().size() == 4u &&
                p.error_layer() == nullptr)
              ++ok[t];
          }
        });
  }
  for (auto& th : readers) th.join();

  for (int n : ok) EXPECT_EQ(n, 1000);
  EXPECT_EQ(trans.calls(), 1);
}
