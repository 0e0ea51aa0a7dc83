/**
 * @file sx1276_RegsLoRa.hpp
 * @author Dominik Kuhn (dominik.kuhn90@googlemail.com)
 * @brief SX1276 / RFM95 register addresses and values used by the uplink driver
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#ifndef __SX1276_REGS_LORA_HPP__
#define __SX1276_REGS_LORA_HPP__

/*!
 * ============================================================================
 * SX1276 Internal registers Address
 * ============================================================================
 */
#define REG_LR_FIFO                                 0x00
#define REG_OPMODE                                  0x01
#define REG_FRFMSB                                  0x06
#define REG_FRFMID                                  0x07
#define REG_FRFLSB                                  0x08
#define REG_PACONFIG                                0x09
#define REG_LR_FIFOADDRPTR                          0x0D
#define REG_LR_FIFOTXBASEADDR                       0x0E
#define REG_LR_FIFORXBASEADDR                       0x0F
#define REG_LR_MODEMCONFIG1                         0x1D
#define REG_LR_MODEMCONFIG2                         0x1E
#define REG_LR_SYMBTIMEOUTLSB                       0x1F
#define REG_LR_PREAMBLEMSB                          0x20
#define REG_LR_PREAMBLELSB                          0x21
#define REG_LR_PAYLOADLENGTH                        0x22
#define REG_LR_MODEMCONFIG3                         0x26
#define REG_LR_INVERTIQ                             0x33
#define REG_LR_SYNCWORD                             0x39
#define REG_LR_INVERTIQ2                            0x3B
#define REG_DIOMAPPING1                             0x40
#define REG_LR_VERSION                              0x42


/*!
 * ============================================================================
 * SX1276 LoRa bits control definition
 * ============================================================================
 */

/*!
 * RegOpMode
 */
#define RFLR_OPMODE_SLEEP                           0x00
#define RFLR_OPMODE_LONGRANGEMODE_ON                0x80
#define RFLR_OPMODE_STANDBY                         0x81
#define RFLR_OPMODE_TRANSMITTER                     0x83

/*!
 * RegPaConfig, max output power on PA_BOOST
 */
#define RF_PACONFIG_MAX_POWER                       0xFF

/*!
 * RegSymbTimeoutLsb
 */
#define RFLR_SYMBTIMEOUTLSB_VALUE                   0x25

/*!
 * RegPreambleMsb / RegPreambleLsb, preamble length 8 symbols
 */
#define RFLR_PREAMBLEMSB_VALUE                      0x00
#define RFLR_PREAMBLELSB_VALUE                      0x08

/*!
 * RegModemConfig3, low datarate optimize off, AGC auto on
 */
#define RFLR_MODEMCONFIG3_INIT                      0x0C

/*!
 * RegSyncWord for public LoRaWAN networks
 */
#define LORA_MAC_PUBLIC_SYNCWORD                    0x34

/*!
 * RegInvertIQ / RegInvertIQ2, normal polarity
 */
#define RFLR_INVERTIQ_NORMAL                        0x27
#define RFLR_INVERTIQ2_NORMAL                       0x1D

/*!
 * FIFO base addresses, the full upper half is used for TX
 */
#define RFLR_FIFOTXBASEADDR_VALUE                   0x80
#define RFLR_FIFORXBASEADDR_VALUE                   0x00

/*!
 * RegDioMapping1, DIO0 = TxDone
 */
#define RFLR_DIOMAPPING1_DIO0_TXDONE                0x40

/*!
 * RegVersion of a genuine SX1276 / RFM95W
 */
#define RFLR_VERSION_SX1276                         0x12

/*!
 * Frequency synthesizer, step = XTAL_FREQ / 2^19
 */
#define XTAL_FREQ                                   32000000

#endif // __SX1276_REGS_LORA_HPP__
