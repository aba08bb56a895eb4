#pragma once
#include <string>

// Function and event signatures of the lending pool and its auxiliary
// contracts. Selectors and topics are derived with Crypto::FunctionSelector /
// Crypto::EventTopic at runtime.
namespace LedgerAbi {
  // LendingPool
  inline const std::string BORROWS = "borrows(address)";
  inline const std::string COLLATERALS = "collaterals(address)";
  inline const std::string LIQUIDATE = "liquidate(address)";

  // FlashLoanProtection
  inline const std::string HAS_ACTIVE_PROTECTION = "hasActiveProtection(address)";
  inline const std::string ACTIVATE_PROTECTION = "activateProtection(address)";
  // returns (uint256 amount, uint256 expirationTime, uint256 remainingUses)
  inline const std::string GET_PROTECTION_DETAILS = "getProtectionDetails(address)";

  // LiquidationAuction: (borrower, collateralAmount, startPrice, reservePrice, duration)
  inline const std::string START_AUCTION = "startAuction(address,uint256,uint256,uint256,uint256)";

  // Events. Indexed parameters are noted beside each.
  inline const std::string EV_BORROW = "Borrow(address,uint256)";                  // user
  inline const std::string EV_REPAY = "Repay(address,uint256)";                    // user
  inline const std::string EV_COLLATERAL_ADDED = "CollateralAdded(address,uint256)";     // user
  inline const std::string EV_COLLATERAL_REMOVED = "CollateralRemoved(address,uint256)"; // user
  // auctionId, borrower; data: collateralAmount
  inline const std::string EV_AUCTION_STARTED = "AuctionStarted(uint256,address,uint256)";
  // auctionId, winner; data: finalPrice
  inline const std::string EV_AUCTION_ENDED = "AuctionEnded(uint256,address,uint256)";
  // user; data: protectionId, amount
  inline const std::string EV_PROTECTION_ACTIVATED = "ProtectionActivated(address,uint256,uint256)";
  // user, liquidator; data: debtCovered, collateralLiquidated, timestamp
  inline const std::string EV_LIQUIDATION = "Liquidation(address,address,uint256,uint256,uint256)";

  // Auction pricing relative to collateral value
  inline constexpr double AUCTION_START_PRICE_FACTOR = 1.20;
  inline constexpr double AUCTION_RESERVE_PRICE_FACTOR = 0.70;
}
